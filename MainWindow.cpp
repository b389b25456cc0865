// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QStatusBar>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QItemSelectionModel>
#include <KFileItem>
#include <QMenu>
#include <QCoreApplication>
#include <QCursor>
#include <QSettings>
#include <QToolButton>
#include <KAboutData>
#include <KAboutApplicationDialog>
#include "MainWindow.h"
#include "FileModel.h"
#include "SettingsDialog.h"

MainWindow::MainWindow(QWidget *parent) : QMainWindow(parent) {
    // Restore persisted UI preferences (last directory).
    loadUiSettings();

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);

    // --- Path Row ---
    auto *topRow = new QHBoxLayout();
    layout->addLayout(topRow);

    auto *upButton = new QToolButton(centralWidget);
    upButton->setIcon(QIcon::fromTheme("go-up"));
    upButton->setToolTip(QStringLiteral("Parent directory"));
    connect(upButton, &QToolButton::clicked, this, &MainWindow::goUp);
    topRow->addWidget(upButton);

    pathLine = new QLineEdit(centralWidget);
    pathLine->setPlaceholderText("Directory...");
    pathLine->setClearButtonEnabled(true);
    pathLine->addAction(QIcon::fromTheme("folder"), QLineEdit::LeadingPosition);
    connect(pathLine, &QLineEdit::returnPressed, this, [this]() { openDirectory(pathLine->text()); });
    topRow->addWidget(pathLine, 1);

    auto *browseButton = new QToolButton(centralWidget);
    browseButton->setIcon(QIcon::fromTheme("document-open-folder"));
    browseButton->setToolTip(QStringLiteral("Choose a directory"));
    connect(browseButton, &QToolButton::clicked, this, &MainWindow::browseForDirectory);
    topRow->addWidget(browseButton);
    // ---------------------

    // --- Burger Menu Setup ---
    auto *menu = new QMenu(this);

    auto *reloadAct = new QAction(QIcon::fromTheme("view-refresh"), "Reload", this);
    reloadAct->setShortcut(QKeySequence::Refresh);
    connect(reloadAct, &QAction::triggered, this, &MainWindow::reload);
    menu->addAction(reloadAct);
    addAction(reloadAct); // Register with window for shortcuts

    auto *settingsAct = new QAction(QIcon::fromTheme("settings-configure"), "Settings", this);
    connect(settingsAct, &QAction::triggered, this, &MainWindow::openSettings);
    menu->addAction(settingsAct);

    menu->addSeparator();

    auto *aboutAct = new QAction(QIcon::fromTheme("kcrtime"), "About KCrtime", this);
    connect(aboutAct, &QAction::triggered, this, &MainWindow::showAbout);
    menu->addAction(aboutAct);

    auto *quitAct = new QAction(QIcon::fromTheme("application-exit"), "Quit", this);
    quitAct->setShortcut(QKeySequence::Quit);
    connect(quitAct, &QAction::triggered, qApp, &QCoreApplication::quit);
    menu->addAction(quitAct);
    addAction(quitAct); // Register with window for shortcuts

    // Add the menu to a button inside the path line
    auto *menuAction = pathLine->addAction(QIcon::fromTheme("application-menu"), QLineEdit::TrailingPosition);
    connect(menuAction, &QAction::triggered, [menu]() {
        // Show the menu just below the icon
        menu->exec(QCursor::pos());
    });
    // ---------------------

    tableView = new QTableView(centralWidget);
    model = new FileModel(this);
    tableView->setModel(model);

    // Enable Sorting
    tableView->setSortingEnabled(true);
    tableView->horizontalHeader()->setSortIndicatorShown(true);
    tableView->sortByColumn(FileModel::ColName, Qt::AscendingOrder);

    // Table Styling
    tableView->setAlternatingRowColors(true);
    tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    tableView->verticalHeader()->setVisible(false);
    tableView->setWordWrap(false);

    tableView->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    tableView->horizontalHeader()->setStretchLastSection(true);

    // Set reasonable default column widths
    tableView->setColumnWidth(FileModel::ColName, 375);
    tableView->setColumnWidth(FileModel::ColSize, 100);
    tableView->setColumnWidth(FileModel::ColModified, 200);
    // Date Created takes the remaining space due to stretchLastSection

    connect(tableView, &QAbstractItemView::activated, this, &MainWindow::onActivated);
    connect(tableView->selectionModel(), &QItemSelectionModel::currentRowChanged, this,
            [this](const QModelIndex& current) { showCreationTime(current.row()); });

    layout->addWidget(tableView);

    setCentralWidget(centralWidget);
    resize(1000, 600);
    setWindowTitle("KCrtime");

    if (!m_lastDirectory.isEmpty()) {
        openDirectory(m_lastDirectory);
    } else {
        openDirectory(QDir::homePath());
    }
}

void MainWindow::openDirectory(const QString& directory) {
    const QString dir = QDir::cleanPath(QDir(directory).absolutePath());

    if (!model->setDirectory(dir)) {
        statusBar()->showMessage(QStringLiteral("Cannot read directory: ") + dir, 5000);
        return;
    }

    // Re-apply the header's current sort on the fresh rows
    model->sort(tableView->horizontalHeader()->sortIndicatorSection(),
                tableView->horizontalHeader()->sortIndicatorOrder());

    pathLine->setText(dir);
    m_lastDirectory = dir;
    saveUiSettings();
    updateStatus();
}

void MainWindow::browseForDirectory() {
    const QString dir = QFileDialog::getExistingDirectory(this, QStringLiteral("Choose Directory"), m_lastDirectory);
    if (!dir.isEmpty()) {
        openDirectory(dir);
    }
}

void MainWindow::reload() {
    if (!model->directory().isEmpty()) {
        openDirectory(model->directory());
    }
}

void MainWindow::goUp() {
    QDir dir(model->directory());
    if (dir.cdUp()) {
        openDirectory(dir.absolutePath());
    }
}

void MainWindow::openSettings() {
    SettingsDialog dlg(this);
    if (dlg.exec() == QDialog::Accepted) {
        model->setDatePreference(dlg.preference());
    }
}

void MainWindow::showAbout() {
    auto *dialog = new KAboutApplicationDialog(KAboutData::applicationData(), this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    dialog->show();
}

void MainWindow::onActivated(const QModelIndex& index) {
    if (!index.isValid()) return;

    const QString path = model->filePath(index.row());
    if (!path.isEmpty() && QFileInfo(path).isDir()) {
        openDirectory(path);
        return;
    }

    showCreationTime(index.row());
}

void MainWindow::showCreationTime(int row) {
    const KFileItem item = model->fileItem(row);
    if (item.isNull()) return;

    // Re-read so the status bar reflects the file as it is now
    const auto created = model->provider().creationTimeAttribute(item);
    if (created) {
        statusBar()->showMessage(QStringLiteral("%1 • created %2").arg(item.name(), *created));
    } else {
        statusBar()->showMessage(QStringLiteral("%1 • no creation time available").arg(item.name()));
    }
}

void MainWindow::updateStatus() {
    const int total = model->rowCount();
    const int withCrtime = model->creationTimeCount();
    statusBar()->showMessage(
        QStringLiteral("%1 item(s) • %2 with a creation time").arg(total).arg(withCrtime), 0);
}

void MainWindow::loadUiSettings() {
    QSettings s;
    s.beginGroup(QStringLiteral("ui"));
    m_lastDirectory = s.value(QStringLiteral("lastDirectory"), QString()).toString();
    s.endGroup();
}

void MainWindow::saveUiSettings() const {
    QSettings s;
    s.beginGroup(QStringLiteral("ui"));
    s.setValue(QStringLiteral("lastDirectory"), m_lastDirectory);
    s.endGroup();
}
