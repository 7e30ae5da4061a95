#ifndef HELLO_SESSION_HPP
#define HELLO_SESSION_HPP

#include "AutostartManager.hpp"
#include "LocaleResolver.hpp"
#include "Preferences.hpp"
#include "SaveStore.hpp"
#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

/**
 * @brief State of one running welcome window, independent of any widget.
 *
 * The window forwards user actions here and re-renders from the returned
 * values. The save record is written once, by shutdown().
 */
class HelloSession {
public:
    using LocaleActivator = std::function<void(const LocaleId&)>;

    struct Environment {
        LocaleId system_locale;
        LocaleResolver::AssetProbe asset_exists;
        std::optional<std::filesystem::path> extra_config;
        std::string domain;
    };

    HelloSession(Preferences preferences, Environment environment,
                 LocaleActivator activate_locale = {});

    // Environment of the current process: $LANG, the gettext catalog probe and ~/.i3/config.
    static Environment system_environment(const Preferences& preferences);

    void start();
    bool shutdown();

    /**
     * @brief Activates a locale chosen in the language selector.
     * @return The active locale; unchanged when @p locale has no catalog
     *         and is not the default locale.
     */
    LocaleId change_locale(const LocaleId& locale);
    LocaleId current_locale() const { return current_locale_; }
    std::vector<LocaleId> available_locales() const;

    const std::vector<PageId>& pages() const { return pages_; }
    std::string page_text(const PageId& page) const;

    bool autostart_enabled() const { return autostart_enabled_; }
    AutostartResult set_autostart(bool desired);

    bool is_live_session() const;
    std::optional<std::string> url_for(const std::string& name) const;

    const Preferences& preferences() const { return preferences_; }
    const SaveRecord& save_record() const { return save_record_; }

private:
    void activate(const LocaleId& locale);

    Preferences preferences_;
    Environment environment_;
    LocaleActivator activate_locale_;
    SaveStore save_store_;
    AutostartManager autostart_;
    std::shared_ptr<spdlog::logger> logger_;

    SaveRecord save_record_;
    LocaleId current_locale_;
    std::vector<PageId> pages_;
    bool autostart_enabled_{false};
    bool shut_down_{false};
};

#endif
