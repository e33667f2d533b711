#include <QApplication>
#include <QStyleFactory>
#include <QDir>
#include <QDebug>
#include "mainwindow.h"
#include "themeprovider.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("Ration Card Processor");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("RationCardProcessor");

    app.setStyle(QStyleFactory::create("Fusion"));

    std::unique_ptr<ThemeProvider> theme = ThemeProvider::create();
    if (theme->isDarkModePreferred()) {
        qInfo() << "Dark mode preferred, using dark palette";
        app.setPalette(ThemeProvider::darkPalette());
    }

    MainWindow window;
    window.show();

    // Optional folder argument
    QStringList args = app.arguments();
    if (args.size() > 1 && QDir(args.at(1)).exists()) {
        window.openFolder(args.at(1));
    }

    return app.exec();
}
