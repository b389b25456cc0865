// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QApplication>
#include <QDebug>
#include <QIcon>
#include <KAboutData>
#include <iostream>
#include <string_view>
#include "CreationTimeProvider.h"
#include "MainWindow.h"
#include "Version.h"

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--version") {
            std::cout << "kcrtime-browser v" << Version::VERSION << std::endl;
            return 0;
        }
    }

    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("kcrtime"));

    KAboutData aboutData(
        QStringLiteral("kcrtime"),
        QStringLiteral("KCrtime"),
        QString::fromUtf8(Version::VERSION.data(), static_cast<qsizetype>(Version::VERSION.size())),
        CreationTimeProvider::pluginDescription(),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters &lt;https://github.com/Reikooters&gt;")
    );

    aboutData.addAuthor("Reikooters", "Developer", "https://github.com/Reikooters");

    // This tells KDE to look for the icon named 'kcrtime' in the system theme
    aboutData.setProgramLogo(QIcon::fromTheme(QStringLiteral("kcrtime")));

    KAboutData::setApplicationData(aboutData);

    QApplication::setWindowIcon(QIcon::fromTheme(QStringLiteral("kcrtime")));

    MainWindow window;

    // Optional positional argument: the directory to show first
    const QStringList args = QCoreApplication::arguments();
    if (args.size() > 1) {
        qInfo().noquote() << "Opening" << args.at(1);
        window.openDirectory(args.at(1));
    }

    window.show();

    return app.exec();
}
