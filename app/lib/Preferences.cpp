#include "Preferences.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <app_version.hpp>

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

using ErrorCodes::Code;

namespace {
constexpr const char* kAppName = APP_ID;
constexpr const char* kPreferencesOverrideEnv = "DISTRO_HELLO_PREFERENCES";

std::string required_string(const Json::Value& root, const char* key, const std::string& source)
{
    if (!root.isMember(key) || !root[key].isString()) {
        THROW_APP_ERROR(Code::CONFIG_REQUIRED_FIELD_MISSING,
                        source + ": missing string key '" + key + "'");
    }
    return root[key].asString();
}

std::string required_path(const Json::Value& root, const char* key, const std::string& source)
{
    return Utils::expand_user_path(required_string(root, key, source));
}
}


std::filesystem::path Preferences::pages_path() const
{
    return std::filesystem::path(data_path) / "pages";
}


std::filesystem::path Preferences::image_path(const std::string& name) const
{
    return std::filesystem::path(data_path) / "img" / (name + ".png");
}


Preferences Preferences::parse(const std::string& json_text, const std::string& source)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::string errors;

    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    if (!reader->parse(json_text.c_str(), json_text.c_str() + json_text.length(), &root, &errors)) {
        THROW_APP_ERROR(Code::CONFIG_PARSE_ERROR, source + ": " + errors);
    }
    if (!root.isObject()) {
        THROW_APP_ERROR(Code::CONFIG_INVALID, source + ": top-level value is not an object");
    }

    Preferences prefs;
    prefs.default_locale = required_string(root, "default_locale", source);
    prefs.data_path = required_path(root, "data_path", source);
    prefs.locale_path = required_path(root, "locale_path", source);
    prefs.ui_path = required_path(root, "ui_path", source);
    prefs.save_path = required_path(root, "save_path", source);
    prefs.autostart_path = required_path(root, "autostart_path", source);
    prefs.desktop_path = required_path(root, "desktop_path", source);
    prefs.logo_path = required_path(root, "logo_path", source);
    prefs.live_path = required_path(root, "live_path", source);
    prefs.installer_path = required_path(root, "installer_path", source);

    if (!root.isMember("urls") || !root["urls"].isObject()) {
        THROW_APP_ERROR(Code::CONFIG_REQUIRED_FIELD_MISSING, source + ": missing object key 'urls'");
    }
    const Json::Value& urls = root["urls"];
    for (const auto& name : urls.getMemberNames()) {
        if (urls[name].isString()) {
            prefs.urls[name] = urls[name].asString();
        }
    }

    if (prefs.default_locale.empty()) {
        THROW_APP_ERROR(Code::CONFIG_INVALID, source + ": 'default_locale' is empty");
    }
    return prefs;
}


Preferences Preferences::load_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_APP_ERROR(Code::CONFIG_LOAD_FAILED, "Cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path);
}


std::string Preferences::installed_file_path()
{
    if (const char* override_path = std::getenv(kPreferencesOverrideEnv); override_path && *override_path) {
        return override_path;
    }
    return std::string("/usr/share/") + kAppName + "/data/preferences.json";
}


void Preferences::apply_development_overrides(const std::filesystem::path& working_dir)
{
    data_path = "data/";
    locale_path = "locale/";
    ui_path = std::string("ui/") + kAppName + ".ui";
    desktop_path = (working_dir / (std::string(kAppName) + ".desktop")).string();
}


Preferences Preferences::load_for_mode(bool development_mode, const std::filesystem::path& working_dir)
{
    auto logger = Logger::get_logger("core_logger");
    if (!development_mode) {
        const std::string path = installed_file_path();
        if (logger) {
            logger->info("Loading preferences from {}", path);
        }
        return load_file(path);
    }

    const std::string path = (working_dir / "data" / "preferences.json").string();
    if (logger) {
        logger->info("Development mode: loading preferences from {}", path);
    }
    Preferences prefs = load_file(path);
    prefs.apply_development_overrides(working_dir);
    return prefs;
}
