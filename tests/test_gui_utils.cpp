// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "minitest.hpp"
#include "test_fs.hpp"
#include "GuiUtils.h"
#include <QSettings>

using GuiUtils::DateFormat;
using GuiUtils::DateFormatPreference;

TEST(iso_format_in_utc) {
  DateFormatPreference pref;
  pref.format = DateFormat::Iso;
  pref.useUtc = true;
  // 2021-01-01T00:00:00Z
  ASSERT_EQ(GuiUtils::formatCreationInstant({1'609'459'200, 0}, pref), QStringLiteral("2021-01-01 00:00:00"));
  ASSERT_EQ(GuiUtils::formatCreationInstant({0, 0}, pref), QStringLiteral("1970-01-01 00:00:00"));
}

TEST(pattern_format_and_empty_pattern_fallback) {
  DateFormatPreference pref;
  pref.format = DateFormat::Pattern;
  pref.useUtc = true;
  pref.pattern = QStringLiteral("dd.MM.yyyy hh:mm:ss.zzz");
  ASSERT_EQ(GuiUtils::formatCreationInstant({1'609'459'200, 250'000'000}, pref),
            QStringLiteral("01.01.2021 00:00:00.250"));

  pref.pattern = QStringLiteral("   ");
  ASSERT_EQ(GuiUtils::formatCreationInstant({1'609'459'200, 0}, pref), QStringLiteral("2021-01-01 00:00:00"));
}

TEST(utc_conversion_before_epoch) {
  const QDateTime dt = GuiUtils::toDateTime({-86'400, 0}, true);
  ASSERT_EQ(dt.toString(QStringLiteral("yyyy-MM-dd")), QStringLiteral("1969-12-31"));
  ASSERT_TRUE(dt.timeSpec() == Qt::UTC);
}

TEST(local_conversion_is_same_instant) {
  const QDateTime local = GuiUtils::toDateTime({1'609'459'200, 0}, false);
  ASSERT_EQ(local.toSecsSinceEpoch(), qint64{1'609'459'200});
}

TEST(date_format_string_round_trip) {
  for (DateFormat f : {DateFormat::Locale, DateFormat::Iso, DateFormat::Pattern}) {
    ASSERT_TRUE(GuiUtils::dateFormatFromString(GuiUtils::dateFormatToString(f)) == f);
  }
  ASSERT_TRUE(GuiUtils::dateFormatFromString(QStringLiteral(" ISO ")) == DateFormat::Iso);
  ASSERT_TRUE(!GuiUtils::dateFormatFromString(QStringLiteral("rfc2822")).has_value());
}

TEST(preference_defaults_when_settings_empty) {
  auto root = testfs::make_root("gui_defaults");
  QSettings settings(QString::fromStdString((root / "empty.ini").string()), QSettings::IniFormat);
  const DateFormatPreference pref = GuiUtils::loadDateFormatPreference(settings);
  ASSERT_TRUE(pref.format == DateFormat::Locale);
  ASSERT_EQ(pref.pattern, QString::fromLatin1(GuiUtils::kIsoPattern));
  ASSERT_TRUE(!pref.useUtc);
}

TEST(preference_persists_in_display_group) {
  auto root = testfs::make_root("gui_persist");
  const QString file = QString::fromStdString((root / "kcrtime.ini").string());

  DateFormatPreference saved;
  saved.format = DateFormat::Pattern;
  saved.pattern = QStringLiteral("yyyy/MM/dd");
  saved.useUtc = true;
  {
    QSettings settings(file, QSettings::IniFormat);
    GuiUtils::saveDateFormatPreference(settings, saved);
  }

  QSettings settings(file, QSettings::IniFormat);
  ASSERT_EQ(settings.value(QStringLiteral("display/dateFormat")).toString(), QStringLiteral("pattern"));
  const DateFormatPreference loaded = GuiUtils::loadDateFormatPreference(settings);
  ASSERT_TRUE(loaded.format == DateFormat::Pattern);
  ASSERT_EQ(loaded.pattern, saved.pattern);
  ASSERT_TRUE(loaded.useUtc);
}

TEST(unknown_stored_format_falls_back_to_locale) {
  auto root = testfs::make_root("gui_unknown");
  QSettings settings(QString::fromStdString((root / "bad.ini").string()), QSettings::IniFormat);
  settings.setValue(QStringLiteral("display/dateFormat"), QStringLiteral("sundial"));
  ASSERT_TRUE(GuiUtils::loadDateFormatPreference(settings).format == DateFormat::Locale);
}
