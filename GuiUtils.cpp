// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "GuiUtils.h"
#include <QLocale>
#include <QTimeZone>

namespace GuiUtils {
    namespace {
        constexpr const char* kGroup = "display";
        constexpr const char* kKeyFormat = "dateFormat";
        constexpr const char* kKeyPattern = "datePattern";
        constexpr const char* kKeyUtc = "useUtc";
    }

    QString dateFormatToString(const DateFormat format) {
        switch (format) {
            case DateFormat::Locale: return QStringLiteral("locale");
            case DateFormat::Iso: return QStringLiteral("iso");
            case DateFormat::Pattern: return QStringLiteral("pattern");
        }
        return QStringLiteral("locale");
    }

    std::optional<DateFormat> dateFormatFromString(const QString& value) {
        const QString v = value.trimmed().toLower();
        if (v == QStringLiteral("locale")) return DateFormat::Locale;
        if (v == QStringLiteral("iso")) return DateFormat::Iso;
        if (v == QStringLiteral("pattern")) return DateFormat::Pattern;
        return std::nullopt;
    }

    DateFormatPreference loadDateFormatPreference(QSettings& settings) {
        DateFormatPreference pref;

        settings.beginGroup(QString::fromLatin1(kGroup));
        if (auto format = dateFormatFromString(settings.value(QString::fromLatin1(kKeyFormat)).toString())) {
            pref.format = *format;
        }
        pref.pattern = settings.value(QString::fromLatin1(kKeyPattern), pref.pattern).toString();
        pref.useUtc = settings.value(QString::fromLatin1(kKeyUtc), false).toBool();
        settings.endGroup();

        return pref;
    }

    DateFormatPreference loadDateFormatPreference() {
        QSettings s;
        return loadDateFormatPreference(s);
    }

    void saveDateFormatPreference(QSettings& settings, const DateFormatPreference& preference) {
        settings.beginGroup(QString::fromLatin1(kGroup));
        settings.setValue(QString::fromLatin1(kKeyFormat), dateFormatToString(preference.format));
        settings.setValue(QString::fromLatin1(kKeyPattern), preference.pattern);
        settings.setValue(QString::fromLatin1(kKeyUtc), preference.useUtc);
        settings.endGroup();
    }

    void saveDateFormatPreference(const DateFormatPreference& preference) {
        QSettings s;
        saveDateFormatPreference(s, preference);
    }

    QDateTime toDateTime(const Crtime::CreationInstant& instant, const bool useUtc) {
        const qint64 msecs = static_cast<qint64>(instant.seconds) * 1000
                           + static_cast<qint64>(instant.nanoseconds / 1'000'000U);

        if (useUtc) {
            return QDateTime::fromMSecsSinceEpoch(msecs, QTimeZone::utc());
        }
        return QDateTime::fromMSecsSinceEpoch(msecs);
    }

    QString formatDateTime(const QDateTime& dateTime, const DateFormatPreference& preference) {
        switch (preference.format) {
            case DateFormat::Locale:
                return QLocale().toString(dateTime, QLocale::LongFormat);
            case DateFormat::Iso:
                return dateTime.toString(QString::fromLatin1(kIsoPattern));
            case DateFormat::Pattern:
                if (preference.pattern.trimmed().isEmpty()) {
                    return dateTime.toString(QString::fromLatin1(kIsoPattern));
                }
                return dateTime.toString(preference.pattern);
        }
        return dateTime.toString(QString::fromLatin1(kIsoPattern));
    }

    QString formatCreationInstant(const Crtime::CreationInstant& instant, const DateFormatPreference& preference) {
        return formatDateTime(toDateTime(instant, preference.useUtc), preference);
    }
}
