// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SettingsDialog.h"

#include <QDateTime>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(QStringLiteral("KCrtime Settings"));

    const GuiUtils::DateFormatPreference current = GuiUtils::loadDateFormatPreference();

    auto* root = new QVBoxLayout(this);
    auto* form = new QFormLayout();
    root->addLayout(form);

    m_formatCombo = new QComboBox(this);
    m_formatCombo->addItem(QStringLiteral("Locale default"), static_cast<int>(GuiUtils::DateFormat::Locale));
    m_formatCombo->addItem(QStringLiteral("ISO-8601 (yyyy-MM-dd HH:mm:ss)"), static_cast<int>(GuiUtils::DateFormat::Iso));
    m_formatCombo->addItem(QStringLiteral("Custom pattern"), static_cast<int>(GuiUtils::DateFormat::Pattern));
    m_formatCombo->setCurrentIndex(m_formatCombo->findData(static_cast<int>(current.format)));
    form->addRow(QStringLiteral("Date format:"), m_formatCombo);

    m_patternEdit = new QLineEdit(current.pattern, this);
    m_patternEdit->setToolTip(QStringLiteral("QDateTime pattern, e.g. dd.MM.yyyy hh:mm"));
    m_patternEdit->setEnabled(current.format == GuiUtils::DateFormat::Pattern);
    form->addRow(QStringLiteral("Pattern:"), m_patternEdit);

    m_utcCheck = new QCheckBox(QStringLiteral("Show times in UTC"), this);
    m_utcCheck->setChecked(current.useUtc);
    form->addRow(QString(), m_utcCheck);

    m_preview = new QLabel(this);
    m_preview->setTextInteractionFlags(Qt::TextSelectableByMouse);
    form->addRow(QStringLiteral("Preview:"), m_preview);

    connect(m_formatCombo, &QComboBox::currentIndexChanged, this, [this](int) {
        m_patternEdit->setEnabled(preference().format == GuiUtils::DateFormat::Pattern);
        updatePreview();
    });
    connect(m_patternEdit, &QLineEdit::textChanged, this, &SettingsDialog::updatePreview);
    connect(m_utcCheck, &QCheckBox::toggled, this, &SettingsDialog::updatePreview);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    root->addWidget(buttons);

    updatePreview();
}

GuiUtils::DateFormatPreference SettingsDialog::preference() const {
    GuiUtils::DateFormatPreference pref;
    pref.format = static_cast<GuiUtils::DateFormat>(m_formatCombo->currentData().toInt());
    pref.pattern = m_patternEdit->text();
    pref.useUtc = m_utcCheck->isChecked();
    return pref;
}

void SettingsDialog::accept() {
    GuiUtils::saveDateFormatPreference(preference());
    QDialog::accept();
}

void SettingsDialog::updatePreview() {
    const GuiUtils::DateFormatPreference pref = preference();
    const QDateTime now = pref.useUtc ? QDateTime::currentDateTimeUtc() : QDateTime::currentDateTime();
    m_preview->setText(GuiUtils::formatDateTime(now, pref));
}
