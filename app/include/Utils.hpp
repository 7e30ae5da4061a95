#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace Utils {

/**
 * @brief Replaces every '~' in a path with the user's home directory.
 * @param path Path as written in the preferences file.
 * @return Path with the home directory expanded; unchanged when HOME is unset.
 */
std::string expand_user_path(const std::string& path);

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

/**
 * @brief Parses the KEY=VALUE lines of an lsb-release stream.
 * @param input Stream positioned at the start of the file contents.
 * @return Codename and release when both are present.
 */
std::optional<LsbInfo> parse_lsb_release(std::istream& input);

/**
 * @brief Reads distribution codename and release from an lsb-release file.
 * @param path File to read, /etc/lsb-release by default.
 * @return Parsed info, or {"unknown", "0.0"} when the file is unusable.
 */
LsbInfo read_lsb_release(const std::string& path = "/etc/lsb-release");

} // namespace Utils

#endif
