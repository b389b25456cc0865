// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_CREATIONTIMEPROVIDER_H
#define KCRTIME_CREATIONTIMEPROVIDER_H

#include <QList>
#include <QString>
#include <optional>
#include "crtime/CrtimeTypes.h"
#include "GuiUtils.h"

class KFileItem;

/**
 * @brief Attaches a "Date Created" attribute to file items for views.
 *
 * This is the file-manager side of the creation-time core: it declares the
 * column it contributes, runs the core for local files and formats the result
 * according to the user's date format preference. A file without a creation
 * time simply gets no attribute; errors are logged and never propagate.
 */
class CreationTimeProvider {
public:
    struct Column {
        QString name;
        QString attribute;
        QString label;
        QString description;
    };

    explicit CreationTimeProvider(GuiUtils::DateFormatPreference preference = {});

    /**
     * @brief Name and description shown in a plugin manager.
     */
    [[nodiscard]] static QString pluginName();
    [[nodiscard]] static QString pluginDescription();

    /**
     * @brief Returns the columns this provider contributes (one: creation_time).
     */
    [[nodiscard]] static QList<Column> columns();

    void setPreference(const GuiUtils::DateFormatPreference& preference) { m_preference = preference; }
    [[nodiscard]] const GuiUtils::DateFormatPreference& preference() const { return m_preference; }

    /**
     * @brief Runs classification and extraction for a local path.
     *
     * Crtime::Error exceptions are caught and logged here; the caller only
     * sees std::nullopt. Unsupported filesystems also yield std::nullopt.
     */
    [[nodiscard]] std::optional<Crtime::CreationInstant> creationInstant(const QString& localPath) const;

    /**
     * @brief Creation instant of a file item. Only items with a "file" URL scheme are handled.
     */
    [[nodiscard]] std::optional<Crtime::CreationInstant> creationInstant(const KFileItem& item) const;

    /**
     * @brief Renders an instant as the creation_time attribute, using the current preference.
     */
    [[nodiscard]] QString formatAttribute(const Crtime::CreationInstant& instant) const;

    /**
     * @brief Returns the formatted creation_time attribute for a file item.
     *
     * Only items with a "file" URL scheme are handled.
     */
    [[nodiscard]] std::optional<QString> creationTimeAttribute(const KFileItem& item) const;

private:
    GuiUtils::DateFormatPreference m_preference;
};

#endif //KCRTIME_CREATIONTIMEPROVIDER_H
