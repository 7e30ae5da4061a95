#include "LocaleResolver.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kLanguageCodeLength = 2;

bool probe(const LocaleResolver::AssetProbe& asset_exists, const LocaleId& id)
{
    if (id.empty() || !asset_exists) {
        return false;
    }
    try {
        return asset_exists(id);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Catalog lookup for '{}' failed: {}", id, ex.what());
        }
        return false;
    }
}

bool is_regular_file_noexcept(const fs::path& path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}
}

namespace LocaleResolver {

LocaleId resolve(const std::optional<LocaleId>& saved,
                 const LocaleId& system_locale,
                 const LocaleId& default_locale,
                 const AssetProbe& asset_exists)
{
    auto logger = Logger::get_logger("core_logger");

    if (saved && probe(asset_exists, *saved)) {
        return *saved;
    }
    if (saved && *saved == default_locale) {
        return default_locale;
    }

    if (!system_locale.empty()) {
        const LocaleId qualified = normalize(system_locale);
        if (probe(asset_exists, qualified)) {
            return qualified;
        }
        const LocaleId language = system_locale.substr(0, kLanguageCodeLength);
        if (probe(asset_exists, language)) {
            return language;
        }
    }

    if (logger) {
        logger->debug("No catalog for saved '{}' or system '{}', using default '{}'",
                      saved.value_or(""), system_locale, default_locale);
    }
    return default_locale;
}


LocaleId normalize(const LocaleId& id)
{
    LocaleId result = id;
    std::replace(result.begin(), result.end(), '_', '-');
    return result;
}


LocaleId to_posix(const LocaleId& id)
{
    LocaleId result = id;
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}


LocaleId system_locale_from_environment()
{
    for (const char* variable : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* value = std::getenv(variable);
        if (!value || !*value) {
            continue;
        }
        std::string locale = value;
        const auto suffix = locale.find_first_of(".@");
        if (suffix != std::string::npos) {
            locale.erase(suffix);
        }
        if (locale == "C" || locale == "POSIX") {
            return {};
        }
        return locale;
    }
    return {};
}


fs::path catalog_path(const fs::path& locale_root, const LocaleId& id, const std::string& domain)
{
    return locale_root / Utils::utf8_to_path(id) / "LC_MESSAGES" / (domain + ".mo");
}


AssetProbe make_catalog_probe(const fs::path& locale_root, const std::string& domain)
{
    return [locale_root, domain](const LocaleId& id) {
        if (id.empty() || id.find('/') != std::string::npos) {
            return false;
        }
        if (is_regular_file_noexcept(catalog_path(locale_root, normalize(id), domain))) {
            return true;
        }
        return is_regular_file_noexcept(catalog_path(locale_root, to_posix(id), domain));
    };
}


std::vector<LocaleId> available_locales(const fs::path& locale_root, const std::string& domain)
{
    std::vector<LocaleId> locales;
    std::error_code ec;
    fs::directory_iterator it(locale_root, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot list locale directory '{}': {}", Utils::path_to_utf8(locale_root), ec.message());
        }
        return locales;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = Utils::path_to_utf8(it->path().filename());
        if (is_regular_file_noexcept(catalog_path(locale_root, name, domain))) {
            locales.push_back(normalize(name));
        }
    }
    std::sort(locales.begin(), locales.end());
    locales.erase(std::unique(locales.begin(), locales.end()), locales.end());
    return locales;
}

} // namespace LocaleResolver
