// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include <PTerm/PTermConfig.hpp>
#include <PTerm/ShellController.hpp>
#include <PTerm/VTermBackend.hpp>
#include <QApplication>
#include <QDebug>

#include "TabbedWindow.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("pterm");

    ConfigStore store;
    qDebug() << "Using configuration" << store.path();
    store.setWatching(true);

    VTermBackend backend;
    ShellController controller(&store, &backend);
    QObject::connect(&store, &ConfigStore::changed, &controller, &ShellController::reloadConfig);

    TabbedWindow mainWindow(&controller);
    mainWindow.resize(1024, 768);
    mainWindow.show();
    controller.openTab();

    return app.exec();
}
