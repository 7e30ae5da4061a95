#include "ContentLoader.hpp"
#include "ErrorMessages.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
std::optional<std::string> try_read(const ContentLoader::FileReader& read_file, const fs::path& path)
{
    if (!read_file) {
        return std::nullopt;
    }
    try {
        return read_file(path);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Reading page '{}' failed: {}", Utils::path_to_utf8(path), ex.what());
        }
        return std::nullopt;
    }
}
}

namespace ContentLoader {

std::optional<std::string> read_text_file(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}


std::string load_page(const fs::path& pages_root,
                      const LocaleId& locale,
                      const LocaleId& default_locale,
                      const PageId& page,
                      const FileReader& read_file)
{
    auto logger = Logger::get_logger("core_logger");

    if (!locale.empty()) {
        if (auto body = try_read(read_file, pages_root / Utils::utf8_to_path(locale) / Utils::utf8_to_path(page))) {
            return *body;
        }
        if (logger) {
            logger->debug("Page '{}' missing for '{}', falling back to '{}'", page, locale, default_locale);
        }
    }

    if (auto body = try_read(read_file, pages_root / Utils::utf8_to_path(default_locale) / Utils::utf8_to_path(page))) {
        return *body;
    }

    if (logger) {
        logger->warn("Page '{}' is unavailable in '{}' and '{}'", page, locale, default_locale);
    }
    return MSG_PAGE_UNAVAILABLE;
}


std::vector<PageId> list_pages(const fs::path& pages_root, const LocaleId& default_locale)
{
    std::vector<PageId> pages;
    const fs::path directory = pages_root / Utils::utf8_to_path(default_locale);
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Cannot list pages in '{}': {}", Utils::path_to_utf8(directory), ec.message());
        }
        return pages;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            pages.push_back(Utils::path_to_utf8(it->path().filename()));
        }
    }
    std::sort(pages.begin(), pages.end());
    return pages;
}

} // namespace ContentLoader
