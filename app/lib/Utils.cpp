#include "Utils.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <map>

namespace {
constexpr const char* kDistribPrefix = "DISTRIB_";

std::string strip_quotes(const std::string& value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}
}

namespace Utils {

std::string expand_user_path(const std::string& path)
{
    if (path.find('~') == std::string::npos) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    std::string expanded;
    expanded.reserve(path.size() + std::char_traits<char>::length(home));
    for (char ch : path) {
        if (ch == '~') {
            expanded += home;
        } else {
            expanded += ch;
        }
    }
    return expanded;
}


std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::optional<LsbInfo> parse_lsb_release(std::istream& input)
{
    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(input, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        const auto delimiter = line.find('=');
        if (delimiter == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, delimiter);
        std::string value = strip_quotes(line.substr(delimiter + 1));
        if (key.rfind(kDistribPrefix, 0) == 0) {
            key = key.substr(std::char_traits<char>::length(kDistribPrefix));
        }
        if (!value.empty()) {
            values[key] = value;
        }
    }

    const auto codename = values.find("CODENAME");
    const auto release = values.find("RELEASE");
    if (codename == values.end() || release == values.end()) {
        return std::nullopt;
    }
    return LsbInfo{codename->second, release->second};
}


LsbInfo read_lsb_release(const std::string& path)
{
    auto logger = Logger::get_logger("core_logger");
    std::ifstream file(path);
    if (!file.is_open()) {
        if (logger) {
            logger->warn("Cannot open '{}', distribution info unavailable", path);
        }
        return LsbInfo{"unknown", "0.0"};
    }
    if (auto info = parse_lsb_release(file)) {
        return *info;
    }
    if (logger) {
        logger->warn("'{}' has no DISTRIB_CODENAME/DISTRIB_RELEASE entries", path);
    }
    return LsbInfo{"unknown", "0.0"};
}

} // namespace Utils
