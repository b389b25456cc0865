// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "CreationTimeProvider.h"

#include <QDebug>
#include <QFile>
#include <QUrl>
#include <KFileItem>
#include <filesystem>
#include <utility>
#include <variant>

#include "crtime/CreationTime.h"

CreationTimeProvider::CreationTimeProvider(GuiUtils::DateFormatPreference preference)
    : m_preference(std::move(preference)) {}

QString CreationTimeProvider::pluginName() {
    return QStringLiteral("KCrtime");
}

QString CreationTimeProvider::pluginDescription() {
    return QStringLiteral("Display creation time for files/folders on NTFS / FAT32 file systems.");
}

QList<CreationTimeProvider::Column> CreationTimeProvider::columns() {
    // "Date Created" matches the file manager's own "Date Modified" / "Date Accessed" labels
    return {
        Column{
            QStringLiteral("KCrtime::creation_time_column"),
            QStringLiteral("creation_time"),
            QStringLiteral("Date Created"),
            QStringLiteral("File/folder creation time (NTFS/FAT32)")
        }
    };
}

std::optional<Crtime::CreationInstant> CreationTimeProvider::creationInstant(const QString& localPath) const {
    if (localPath.isEmpty()) {
        return std::nullopt;
    }

    const std::filesystem::path path(QFile::encodeName(localPath).toStdString());

    try {
        const Crtime::ExtractionResult result = CreationTime::creationTime(path);
        if (const auto* instant = std::get_if<Crtime::CreationInstant>(&result)) {
            return *instant;
        }
        return std::nullopt;
    } catch (const Crtime::Error& e) {
        qWarning().noquote() << "Creation time unavailable for" << localPath << ":" << e.what();
        return std::nullopt;
    }
}

std::optional<Crtime::CreationInstant> CreationTimeProvider::creationInstant(const KFileItem& item) const {
    if (item.isNull() || item.url().scheme() != QStringLiteral("file")) {
        return std::nullopt;
    }
    return creationInstant(item.localPath());
}

QString CreationTimeProvider::formatAttribute(const Crtime::CreationInstant& instant) const {
    return GuiUtils::formatCreationInstant(instant, m_preference);
}

std::optional<QString> CreationTimeProvider::creationTimeAttribute(const KFileItem& item) const {
    const auto instant = creationInstant(item);
    if (!instant) {
        return std::nullopt;
    }
    return formatAttribute(*instant);
}
