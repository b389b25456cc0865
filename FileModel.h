// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_FILEMODEL_H
#define KCRTIME_FILEMODEL_H

#include <QAbstractTableModel>
#include <QString>
#include <KFileItem>
#include <optional>
#include <vector>
#include "CreationTimeProvider.h"

/**
 * @brief The FileModel class lists one directory with a "Date Created" column.
 *
 * Name, Size and Date Modified come from QFileInfo; Date Created is the
 * creation_time attribute CreationTimeProvider attaches to each row's KFileItem. Creation times are gathered
 * in parallel via TBB when the directory is loaded.
 */
class FileModel : public QAbstractTableModel {
    Q_OBJECT

public:
    enum Column {
        ColName = 0,
        ColSize,
        ColModified,
        ColCreated,
        ColCount
    };

    explicit FileModel(QObject *parent = nullptr);

    /**
     * @brief Lists the entries of a directory and computes their creation times.
     * @return false if the directory cannot be read; the model is left empty.
     */
    bool setDirectory(const QString& directory);

    [[nodiscard]] const QString& directory() const { return m_directory; }

    /**
     * @brief Changes how dates are rendered. Existing rows are re-rendered, not re-read.
     */
    void setDatePreference(const GuiUtils::DateFormatPreference& preference);

    /**
     * @brief Number of rows for which a creation time could be determined.
     */
    [[nodiscard]] int creationTimeCount() const;

    /**
     * @brief Sorts the rows on the specified column.
     * Uses C++17 parallel algorithms (TBB).
     */
    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;

    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    /**
     * @brief Provides data for the view, including text display and file/folder icons.
     */
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;

    /**
     * @brief Absolute path of the entry shown at a given row, or an empty string.
     */
    [[nodiscard]] QString filePath(int row) const;

    /**
     * @brief The KFileItem of a row, or a null item if the row is out of range.
     */
    [[nodiscard]] KFileItem fileItem(int row) const;

    [[nodiscard]] const CreationTimeProvider& provider() const { return m_provider; }

private:
    struct Row {
        QString name;
        QString path;
        KFileItem item;
        qint64 size = 0;
        qint64 modifiedSecs = 0;
        bool isDir = false;
        std::optional<Crtime::CreationInstant> created;
    };

    std::vector<Row> m_rows;
    QString m_directory;
    CreationTimeProvider m_provider;
};

#endif //KCRTIME_FILEMODEL_H
