#ifndef THEMEPROVIDER_H
#define THEMEPROVIDER_H

#include <QPalette>
#include <memory>

/**
 * @brief Answers whether the desktop prefers a dark color scheme
 */
class ThemeProvider
{
public:
    virtual ~ThemeProvider() = default;
    virtual bool isDarkModePreferred() const = 0;

    /**
     * Create the best provider for the running platform
     */
    static std::unique_ptr<ThemeProvider> create();

    /**
     * Dark Fusion palette used when dark mode is preferred
     */
    static QPalette darkPalette();
};

/**
 * Fallback for platforms without a usable preference
 */
class NoThemeProvider : public ThemeProvider
{
public:
    bool isDarkModePreferred() const override { return false; }
};

/**
 * Infers the preference from a palette's window lightness
 */
class PaletteThemeProvider : public ThemeProvider
{
public:
    explicit PaletteThemeProvider(const QPalette& palette);
    bool isDarkModePreferred() const override;

    static bool isDarkPalette(const QPalette& palette);

private:
    QPalette m_palette;
};

#ifdef Q_OS_WIN
/**
 * Reads AppsUseLightTheme from the Windows personalization registry key
 */
class WindowsThemeProvider : public ThemeProvider
{
public:
    bool isDarkModePreferred() const override;
};
#endif

#endif // THEMEPROVIDER_H
