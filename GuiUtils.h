// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_GUIUTILS_H
#define KCRTIME_GUIUTILS_H

#include <QDateTime>
#include <QSettings>
#include <QString>
#include <optional>
#include "crtime/CrtimeTypes.h"

namespace GuiUtils {
    enum class DateFormat {
        Locale,  // the user's locale, long form
        Iso,     // yyyy-MM-dd HH:mm:ss
        Pattern  // free-form QDateTime pattern
    };

    inline constexpr const char* kIsoPattern = "yyyy-MM-dd HH:mm:ss";

    struct DateFormatPreference {
        DateFormat format = DateFormat::Locale;
        QString pattern = QString::fromLatin1(kIsoPattern);
        bool useUtc = false;
    };

    /**
     * Stable identifiers stored in the settings file ("locale", "iso", "pattern").
     */
    [[nodiscard]] QString dateFormatToString(DateFormat format);
    [[nodiscard]] std::optional<DateFormat> dateFormatFromString(const QString& value);

    /**
     * Reads the date format preference from the "display" settings group.
     *
     * Unknown or missing values fall back to the defaults of DateFormatPreference.
     * The overload without arguments uses the application's default QSettings.
     */
    [[nodiscard]] DateFormatPreference loadDateFormatPreference(QSettings& settings);
    [[nodiscard]] DateFormatPreference loadDateFormatPreference();

    void saveDateFormatPreference(QSettings& settings, const DateFormatPreference& preference);
    void saveDateFormatPreference(const DateFormatPreference& preference);

    /**
     * Converts a creation instant to a QDateTime in UTC or in the local time zone.
     * Sub-millisecond precision is dropped.
     */
    [[nodiscard]] QDateTime toDateTime(const Crtime::CreationInstant& instant, bool useUtc);

    /**
     * Formats a creation instant according to the user's preference.
     *
     * An empty custom pattern falls back to the ISO layout.
     */
    [[nodiscard]] QString formatDateTime(const QDateTime& dateTime, const DateFormatPreference& preference);
    [[nodiscard]] QString formatCreationInstant(const Crtime::CreationInstant& instant,
                                                const DateFormatPreference& preference);
}

#endif //KCRTIME_GUIUTILS_H
