#include "AutostartManager.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {
constexpr const char* kTempSuffix = ".distro-hello.tmp";

AutostartResult failure(Code code, const std::string& detail)
{
    AutostartResult result;
    result.success = false;
    result.error_code = code;
    result.detail = detail;
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Autostart: {} (code {})", detail, ErrorCodes::to_int(code));
    }
    return result;
}

bool is_blank(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\r';
}

struct DirectiveLine {
    std::string indent;
    std::string trailing;
    bool commented{false};
};

// Splits a line into indentation, comment state and trailing whitespace
// when its payload equals the directive.
std::optional<DirectiveLine> match_directive(const std::string& line, const std::string& directive)
{
    std::size_t begin = 0;
    while (begin < line.size() && is_blank(line[begin])) {
        ++begin;
    }
    std::size_t end = line.size();
    while (end > begin && is_blank(line[end - 1])) {
        --end;
    }

    DirectiveLine match;
    match.indent = line.substr(0, begin);
    match.trailing = line.substr(end);

    std::size_t payload = begin;
    while (payload < end && line[payload] == '#') {
        match.commented = true;
        ++payload;
    }
    if (match.commented) {
        while (payload < end && is_blank(line[payload])) {
            ++payload;
        }
    }
    if (line.compare(payload, end - payload, directive) != 0) {
        return std::nullopt;
    }
    return match;
}

std::optional<std::string> read_whole_file(const fs::path& path, std::string& error)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open " + Utils::path_to_utf8(path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "cannot read " + Utils::path_to_utf8(path);
        return std::nullopt;
    }
    return buffer.str();
}
}


AutostartManager::AutostartManager(fs::path desktop_entry,
                                   fs::path link_path,
                                   std::optional<fs::path> extra_config,
                                   std::string launch_directive)
    : desktop_entry_(std::move(desktop_entry)),
      link_path_(std::move(link_path)),
      extra_config_(std::move(extra_config)),
      launch_directive_(std::move(launch_directive))
{}


AutostartState AutostartManager::current_state() const
{
    std::error_code ec;
    const auto status = fs::symlink_status(link_path_, ec);
    if (ec || !fs::exists(status)) {
        return AutostartState::Unregistered;
    }
    return AutostartState::Registered;
}


AutostartResult AutostartManager::set_autostart(bool desired) const
{
    AutostartResult link_result = apply_link_state(desired);
    AutostartResult config_result = rewrite_extra_config(desired);

    if (!link_result) {
        link_result.changed = link_result.changed || config_result.changed;
        return link_result;
    }
    if (!config_result) {
        config_result.changed = config_result.changed || link_result.changed;
        return config_result;
    }
    link_result.changed = link_result.changed || config_result.changed;
    return link_result;
}


AutostartResult AutostartManager::apply_link_state(bool desired) const
{
    auto logger = Logger::get_logger("core_logger");
    const AutostartState state = current_state();
    AutostartResult result;
    std::error_code ec;

    if (desired && state == AutostartState::Unregistered) {
        if (link_path_.has_parent_path()) {
            fs::create_directories(link_path_.parent_path(), ec);
            if (ec) {
                return failure(Code::DIRECTORY_CREATE_FAILED,
                               "cannot create " + Utils::path_to_utf8(link_path_.parent_path()) + ": " + ec.message());
            }
        }
        fs::create_symlink(desktop_entry_, link_path_, ec);
        if (ec) {
            return failure(Code::FILE_WRITE_FAILED,
                           "cannot link " + Utils::path_to_utf8(link_path_) + ": " + ec.message());
        }
        result.changed = true;
        if (logger) {
            logger->info("Autostart enabled: {} -> {}", Utils::path_to_utf8(link_path_),
                         Utils::path_to_utf8(desktop_entry_));
        }
    } else if (!desired && state == AutostartState::Registered) {
        fs::remove(link_path_, ec);
        if (ec) {
            return failure(Code::FILE_DELETE_FAILED,
                           "cannot remove " + Utils::path_to_utf8(link_path_) + ": " + ec.message());
        }
        result.changed = true;
        if (logger) {
            logger->info("Autostart disabled: removed {}", Utils::path_to_utf8(link_path_));
        }
    } else if (logger) {
        logger->debug("Autostart already {}", to_string(state));
    }
    return result;
}


AutostartResult AutostartManager::rewrite_extra_config(bool desired) const
{
    AutostartResult result;
    if (!extra_config_ || launch_directive_.empty()) {
        return result;
    }

    std::error_code ec;
    if (!fs::is_regular_file(*extra_config_, ec)) {
        return result;
    }

    // Write through a symlinked config so the link itself survives the rename.
    fs::path target = *extra_config_;
    if (fs::is_symlink(target, ec)) {
        target = fs::canonical(target, ec);
        if (ec) {
            return failure(Code::PATH_INVALID,
                           "cannot resolve " + Utils::path_to_utf8(*extra_config_) + ": " + ec.message());
        }
    }

    std::string error;
    const auto content = read_whole_file(target, error);
    if (!content) {
        return failure(Code::FILE_READ_FAILED, error);
    }

    const std::string updated = toggle_launch_directive(*content, launch_directive_, desired);
    if (updated == *content) {
        return result;
    }

    fs::path temp_path = target;
    temp_path += kTempSuffix;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return failure(Code::FILE_WRITE_FAILED, "cannot create " + Utils::path_to_utf8(temp_path));
        }
        out << updated;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            return failure(Code::FILE_WRITE_FAILED, "cannot write " + Utils::path_to_utf8(temp_path));
        }
    }

    const auto permissions = fs::status(target, ec).permissions();
    if (!ec) {
        fs::permissions(temp_path, permissions, ec);
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        const std::string message = ec.message();
        fs::remove(temp_path, ec);
        return failure(Code::FILE_MOVE_FAILED,
                       "cannot replace " + Utils::path_to_utf8(target) + ": " + message);
    }

    result.changed = true;
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("{} launch directive in {}", desired ? "Enabled" : "Disabled",
                     Utils::path_to_utf8(target));
    }
    return result;
}


std::string AutostartManager::toggle_launch_directive(const std::string& content,
                                                      const std::string& directive,
                                                      bool enable)
{
    if (directive.empty()) {
        return content;
    }

    std::string output;
    output.reserve(content.size() + 8);
    std::size_t start = 0;
    while (start <= content.size()) {
        const std::size_t newline = content.find('\n', start);
        const std::size_t stop = newline == std::string::npos ? content.size() : newline;
        const std::string line = content.substr(start, stop - start);

        const auto match = match_directive(line, directive);
        if (match && match->commented && enable) {
            output += match->indent + directive + match->trailing;
        } else if (match && !match->commented && !enable) {
            output += match->indent + "#" + directive + match->trailing;
        } else {
            output += line;
        }

        if (newline == std::string::npos) {
            break;
        }
        output += '\n';
        start = newline + 1;
    }
    return output;
}


std::string AutostartManager::default_launch_directive(const std::string& app_name)
{
    return "exec --no-startup-id " + app_name;
}


fs::path AutostartManager::default_i3_config_path()
{
    return Utils::utf8_to_path(Utils::expand_user_path("~/.i3/config"));
}
