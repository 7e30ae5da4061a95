#ifndef CONTENT_LOADER_HPP
#define CONTENT_LOADER_HPP

#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ContentLoader {

// Returns the file contents, or std::nullopt when the file cannot be read.
using FileReader = std::function<std::optional<std::string>(const std::filesystem::path&)>;

std::optional<std::string> read_text_file(const std::filesystem::path& path);

/**
 * @brief Returns the body of a page, preferring the requested locale.
 *
 * Reads <pages_root>/<locale>/<page>, then <pages_root>/<default_locale>/<page>.
 * When neither can be read, returns the translated "Can't load page." message.
 * Never throws; a reader that throws counts as a missing file. Nothing is cached.
 */
std::string load_page(const std::filesystem::path& pages_root,
                      const LocaleId& locale,
                      const LocaleId& default_locale,
                      const PageId& page,
                      const FileReader& read_file = read_text_file);

// Page ids found in <pages_root>/<default_locale>, sorted; empty when the directory is unreadable.
std::vector<PageId> list_pages(const std::filesystem::path& pages_root, const LocaleId& default_locale);

} // namespace ContentLoader

#endif
