// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

// TBB and Qt both want 'emit'.
// We must undefine it before including <execution>
#ifdef emit
#define QT_EMIT_BACKUP emit
#undef emit
#endif

#include <execution>
#include <tbb/parallel_for.h>

#ifdef QT_EMIT_BACKUP
#define emit QT_EMIT_BACKUP
#undef QT_EMIT_BACKUP
#endif

#include <algorithm>
#include <tuple>
#include <QDir>
#include <QFileInfo>
#include <QIcon>
#include <QLocale>
#include <QUrl>
#include "FileModel.h"

FileModel::FileModel(QObject *parent)
    : QAbstractTableModel(parent), m_provider(GuiUtils::loadDateFormatPreference()) {}

bool FileModel::setDirectory(const QString& directory) {
    beginResetModel(); // Notify views that the entire model is being reset
    m_rows.clear();
    m_directory = QDir::cleanPath(directory);

    const QDir dir(m_directory);
    if (!dir.exists() || !dir.isReadable()) {
        endResetModel();
        return false;
    }

    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::Name | QDir::DirsFirst | QDir::IgnoreCase);

    m_rows.resize(static_cast<size_t>(entries.size()));
    for (qsizetype i = 0; i < entries.size(); ++i) {
        const QFileInfo& fi = entries.at(i);
        Row& row = m_rows[static_cast<size_t>(i)];
        row.name = fi.fileName();
        row.path = fi.absoluteFilePath();
        row.item = KFileItem(QUrl::fromLocalFile(row.path));
        row.isDir = fi.isDir();
        row.size = row.isDir ? 0 : fi.size();
        row.modifiedSecs = fi.lastModified().toSecsSinceEpoch();
    }

    // Each lookup is an independent classify + extract; nothing is shared between rows.
    tbb::parallel_for(size_t{0}, m_rows.size(), [this](size_t i) {
        m_rows[i].created = m_provider.creationInstant(m_rows[i].item);
    });

    endResetModel();
    return true;
}

void FileModel::setDatePreference(const GuiUtils::DateFormatPreference& preference) {
    m_provider.setPreference(preference);
    if (m_rows.empty()) {
        return;
    }
    Q_EMIT dataChanged(index(0, ColModified), index(rowCount() - 1, ColCreated), {Qt::DisplayRole});
}

int FileModel::creationTimeCount() const {
    return static_cast<int>(std::count_if(m_rows.begin(), m_rows.end(),
                                          [](const Row& r) { return r.created.has_value(); }));
}

void FileModel::sort(int column, Qt::SortOrder order) {
    if (m_rows.empty()) {
        return;
    }

    beginResetModel();

    // Use parallel execution policy to leverage multiple CPU cores via TBB
    auto policy = std::execution::par;

    auto createdKey = [](const Row& r) {
        return std::make_tuple(r.created.has_value(),
                               r.created ? r.created->seconds : int64_t{0},
                               r.created ? r.created->nanoseconds : uint32_t{0});
    };

    auto isLess = [&](const Row& a, const Row& b) {
        switch (column) {
            case ColName:
                return QString::compare(a.name, b.name, Qt::CaseInsensitive) < 0;
            case ColSize:
                return a.size < b.size;
            case ColModified:
                return a.modifiedSecs < b.modifiedSecs;
            case ColCreated:
                return createdKey(a) < createdKey(b);
            default:
                return false;
        }
    };

    // For descending, we check if B < A.
    // This preserves strict weak ordering.
    if (order == Qt::AscendingOrder) {
        std::stable_sort(policy, m_rows.begin(), m_rows.end(), isLess);
    } else {
        std::stable_sort(policy, m_rows.begin(), m_rows.end(),
                         [&](const Row& a, const Row& b) { return isLess(b, a); });
    }

    endResetModel();
}

int FileModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid()) return 0;
    return static_cast<int>(m_rows.size());
}

int FileModel::columnCount(const QModelIndex &parent) const {
    if (parent.isValid()) return 0;
    return ColCount;
}

QVariant FileModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation != Qt::Horizontal) return {};

    if (role == Qt::ToolTipRole && section == ColCreated) {
        return CreationTimeProvider::columns().first().description;
    }
    if (role != Qt::DisplayRole) return {};

    switch (section) {
        case ColName: return QStringLiteral("Name");
        case ColSize: return QStringLiteral("Size");
        case ColModified: return QStringLiteral("Date Modified");
        case ColCreated: return CreationTimeProvider::columns().first().label;
        default: return {};
    }
}

QVariant FileModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid()
        || index.row() < 0 || index.row() >= static_cast<int>(m_rows.size())
        || (!(role == Qt::DecorationRole && index.column() == ColName) && role != Qt::DisplayRole)) {
        return {};
    }

    const Row& row = m_rows[static_cast<size_t>(index.row())];

    // Using standard KDE/Freedesktop theme names for icons
    if (role == Qt::DecorationRole) {
        return row.isDir ? QIcon::fromTheme(QStringLiteral("inode-directory"))
                         : QIcon::fromTheme(QStringLiteral("text-x-generic"));
    }

    switch (index.column()) {
        case ColName:
            return row.name;
        case ColSize:
            if (row.isDir) return QStringLiteral("<DIR>");
            // Formats the raw byte count with appropriate thousands separators
            return QLocale().toString(static_cast<qlonglong>(row.size));
        case ColModified:
            return GuiUtils::formatDateTime(
                GuiUtils::toDateTime(Crtime::CreationInstant{row.modifiedSecs, 0}, m_provider.preference().useUtc),
                m_provider.preference());
        case ColCreated:
            // No attribute when the filesystem has none or the lookup failed
            if (!row.created) return {};
            return m_provider.formatAttribute(*row.created);
        default:
            return {};
    }
}

QString FileModel::filePath(int row) const {
    if (row < 0 || row >= static_cast<int>(m_rows.size())) {
        return {};
    }
    return m_rows[static_cast<size_t>(row)].path;
}

KFileItem FileModel::fileItem(int row) const {
    if (row < 0 || row >= static_cast<int>(m_rows.size())) {
        return {};
    }
    return m_rows[static_cast<size_t>(row)].item;
}
