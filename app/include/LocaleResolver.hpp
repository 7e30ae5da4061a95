#ifndef LOCALE_RESOLVER_HPP
#define LOCALE_RESOLVER_HPP

#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace LocaleResolver {

using AssetProbe = std::function<bool(const LocaleId&)>;

/**
 * @brief Picks the locale to activate.
 *
 * Precedence: the saved choice when its catalog exists, the default locale
 * when it was saved explicitly, the territory-qualified system locale, the
 * bare system language, and finally the default locale.
 *
 * @param saved Locale stored in the save record, if any.
 * @param system_locale System locale such as "en_US"; may be empty.
 * @param default_locale Locale whose assets are always installed.
 * @param asset_exists Returns true when a translation catalog exists for an id.
 * @return Locale id in hyphen form, or @p default_locale.
 */
LocaleId resolve(const std::optional<LocaleId>& saved,
                 const LocaleId& system_locale,
                 const LocaleId& default_locale,
                 const AssetProbe& asset_exists);

// "en_US" -> "en-US"
LocaleId normalize(const LocaleId& id);

// "en-US" -> "en_US", the spelling gettext expects in LANGUAGE.
LocaleId to_posix(const LocaleId& id);

/**
 * @brief Reads the system locale from LC_ALL, LC_MESSAGES or LANG.
 * @return Locale without codeset or modifier ("de_DE.UTF-8@euro" -> "de_DE"),
 *         or an empty string for unset, "C" and "POSIX".
 */
LocaleId system_locale_from_environment();

std::filesystem::path catalog_path(const std::filesystem::path& locale_root,
                                   const LocaleId& id,
                                   const std::string& domain);

// Probe over <root>/<id>/LC_MESSAGES/<domain>.mo, trying the hyphen then the underscore spelling.
AssetProbe make_catalog_probe(const std::filesystem::path& locale_root, const std::string& domain);

// Installed catalogs under the root, hyphen form, sorted.
std::vector<LocaleId> available_locales(const std::filesystem::path& locale_root,
                                        const std::string& domain);

} // namespace LocaleResolver

#endif
