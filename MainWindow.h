// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_MAINWINDOW_H
#define KCRTIME_MAINWINDOW_H

#include <QMainWindow>
#include <QLineEdit>
#include <QTableView>
#include <QString>

class FileModel;

/**
 * @brief The main application window: a directory listing with a Date Created column.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    /**
     * @brief Lists the given directory. Shows a status message if it cannot be read.
     */
    void openDirectory(const QString& directory);

private slots:
    void browseForDirectory();
    void reload();
    void goUp();
    void openSettings();
    void showAbout();

    /**
     * @brief Directories are entered; for files the creation time is shown in the status bar.
     */
    void onActivated(const QModelIndex& index);

private:
    void showCreationTime(int row);
    void updateStatus();

    void loadUiSettings();
    void saveUiSettings() const;

    QLineEdit *pathLine = nullptr;
    QTableView *tableView = nullptr;
    FileModel *model = nullptr;

    QString m_lastDirectory;
};

#endif //KCRTIME_MAINWINDOW_H
