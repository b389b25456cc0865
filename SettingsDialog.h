// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_SETTINGSDIALOG_H
#define KCRTIME_SETTINGSDIALOG_H

#include <QDialog>
#include <QCheckBox>
#include <QComboBox>
#include <QLabel>
#include <QLineEdit>
#include "GuiUtils.h"

class SettingsDialog final : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget* parent = nullptr);

    /**
     * @brief The preference as currently edited in the dialog (not necessarily saved).
     */
    [[nodiscard]] GuiUtils::DateFormatPreference preference() const;

public slots:
    void accept() override;

private slots:
    void updatePreview();

private:
    QComboBox* m_formatCombo = nullptr;
    QLineEdit* m_patternEdit = nullptr;
    QCheckBox* m_utcCheck = nullptr;
    QLabel* m_preview = nullptr;
};

#endif //KCRTIME_SETTINGSDIALOG_H
