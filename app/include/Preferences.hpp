#ifndef PREFERENCES_HPP
#define PREFERENCES_HPP

#include "Types.hpp"

#include <filesystem>
#include <map>
#include <string>

/**
 * @brief Read-only application preferences, loaded once at startup.
 *
 * Every path field has '~' expanded at load time.
 */
struct Preferences {
    LocaleId default_locale;
    std::string data_path;
    std::string locale_path;
    std::string ui_path;
    std::string save_path;
    std::string autostart_path;
    std::string desktop_path;
    std::string logo_path;
    std::string live_path;
    std::string installer_path;
    std::map<std::string, std::string> urls;

    std::filesystem::path pages_path() const;
    std::filesystem::path image_path(const std::string& name) const;

    /**
     * @brief Loads preferences from a JSON file.
     * @param path File to read.
     * @return Parsed preferences.
     * @throws ErrorCodes::AppException when the file is missing, malformed or incomplete.
     */
    static Preferences load_file(const std::string& path);

    /**
     * @brief Parses preferences from JSON text.
     * @param json_text Document contents.
     * @param source Name used in error context.
     * @throws ErrorCodes::AppException on malformed JSON or a missing key.
     */
    static Preferences parse(const std::string& json_text, const std::string& source);

    /**
     * @brief Loads the preferences for the installed or the development layout.
     * @param development_mode True when running from the source tree (--dev).
     * @param working_dir Directory the development layout is relative to.
     */
    static Preferences load_for_mode(bool development_mode,
                                     const std::filesystem::path& working_dir);

    static std::string installed_file_path();

    // Redirects data, locale, ui and desktop entry paths to the source tree layout.
    void apply_development_overrides(const std::filesystem::path& working_dir);
};

#endif
