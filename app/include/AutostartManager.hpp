#ifndef AUTOSTART_MANAGER_HPP
#define AUTOSTART_MANAGER_HPP

#include "ErrorCode.hpp"
#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>

struct AutostartResult {
    bool success{true};
    bool changed{false};
    ErrorCodes::Code error_code{ErrorCodes::Code::SUCCESS};
    std::string detail;

    explicit operator bool() const { return success; }
};

/**
 * @brief Registers or unregisters the application for start on login.
 *
 * The registration is a symlink from the autostart directory to the
 * application's desktop entry. When a window manager config is given and
 * exists, its launch directive is commented or uncommented to match.
 * Every call re-reads the state from disk; nothing is cached.
 */
class AutostartManager {
public:
    AutostartManager(std::filesystem::path desktop_entry,
                     std::filesystem::path link_path,
                     std::optional<std::filesystem::path> extra_config,
                     std::string launch_directive);

    AutostartState current_state() const;
    bool is_registered() const { return current_state() == AutostartState::Registered; }

    /**
     * @brief Brings the on-disk registration in line with @p desired.
     * @return Failure with an error code when a filesystem operation fails.
     *         Repeating a call with the same value changes nothing.
     */
    AutostartResult set_autostart(bool desired) const;

    const std::filesystem::path& link_path() const { return link_path_; }

    /**
     * @brief Comments or uncomments every line holding exactly @p directive.
     *
     * A line matches when, after leading whitespace and any '#' markers and
     * spaces, it equals the directive up to trailing whitespace. Indentation
     * is preserved. Lines already in the wanted form are left untouched.
     */
    static std::string toggle_launch_directive(const std::string& content,
                                               const std::string& directive,
                                               bool enable);

    static std::string default_launch_directive(const std::string& app_name);
    static std::filesystem::path default_i3_config_path();

private:
    AutostartResult apply_link_state(bool desired) const;
    AutostartResult rewrite_extra_config(bool desired) const;

    std::filesystem::path desktop_entry_;
    std::filesystem::path link_path_;
    std::optional<std::filesystem::path> extra_config_;
    std::string launch_directive_;
};

#endif
