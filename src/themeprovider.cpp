#include "themeprovider.h"
#include <QGuiApplication>
#include <QSettings>
#include <QColor>
#include <QDebug>

std::unique_ptr<ThemeProvider> ThemeProvider::create()
{
#ifdef Q_OS_WIN
    return std::make_unique<WindowsThemeProvider>();
#else
    if (qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        return std::make_unique<PaletteThemeProvider>(QGuiApplication::palette());
    }
    return std::make_unique<NoThemeProvider>();
#endif
}

QPalette ThemeProvider::darkPalette()
{
    QPalette palette;
    palette.setColor(QPalette::Window, QColor(53, 53, 53));
    palette.setColor(QPalette::WindowText, Qt::white);
    palette.setColor(QPalette::Base, QColor(35, 35, 35));
    palette.setColor(QPalette::AlternateBase, QColor(53, 53, 53));
    palette.setColor(QPalette::ToolTipBase, QColor(25, 25, 25));
    palette.setColor(QPalette::ToolTipText, Qt::white);
    palette.setColor(QPalette::Text, Qt::white);
    palette.setColor(QPalette::Button, QColor(53, 53, 53));
    palette.setColor(QPalette::ButtonText, Qt::white);
    palette.setColor(QPalette::BrightText, Qt::red);
    palette.setColor(QPalette::Link, QColor(42, 130, 218));
    palette.setColor(QPalette::Highlight, QColor(42, 130, 218));
    palette.setColor(QPalette::HighlightedText, QColor(35, 35, 35));
    palette.setColor(QPalette::Disabled, QPalette::Text, QColor(127, 127, 127));
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(127, 127, 127));
    return palette;
}

PaletteThemeProvider::PaletteThemeProvider(const QPalette& palette)
    : m_palette(palette)
{
}

bool PaletteThemeProvider::isDarkModePreferred() const
{
    return isDarkPalette(m_palette);
}

bool PaletteThemeProvider::isDarkPalette(const QPalette& palette)
{
    return palette.color(QPalette::Window).lightness() < palette.color(QPalette::WindowText).lightness();
}

#ifdef Q_OS_WIN
bool WindowsThemeProvider::isDarkModePreferred() const
{
    QSettings registry("HKEY_CURRENT_USER\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Themes\\Personalize",
                       QSettings::NativeFormat);
    if (!registry.contains("AppsUseLightTheme")) {
        qDebug() << "WindowsThemeProvider: AppsUseLightTheme not set, assuming light theme";
        return false;
    }
    return registry.value("AppsUseLightTheme").toInt() == 0;
}
#endif
