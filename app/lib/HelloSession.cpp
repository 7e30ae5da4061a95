#include "HelloSession.hpp"
#include "ContentLoader.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <app_version.hpp>

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

HelloSession::HelloSession(Preferences preferences, Environment environment,
                           LocaleActivator activate_locale)
    : preferences_(std::move(preferences)),
      environment_(std::move(environment)),
      activate_locale_(std::move(activate_locale)),
      save_store_(preferences_.save_path),
      autostart_(Utils::utf8_to_path(preferences_.desktop_path),
                 Utils::utf8_to_path(preferences_.autostart_path),
                 environment_.extra_config,
                 AutostartManager::default_launch_directive(APP_ID)),
      logger_(Logger::get_logger("core_logger")),
      current_locale_(preferences_.default_locale)
{}


HelloSession::Environment HelloSession::system_environment(const Preferences& preferences)
{
    Environment environment;
    environment.system_locale = LocaleResolver::system_locale_from_environment();
    environment.asset_exists = LocaleResolver::make_catalog_probe(
        Utils::utf8_to_path(preferences.locale_path), APP_ID);
    environment.extra_config = AutostartManager::default_i3_config_path();
    environment.domain = APP_ID;
    return environment;
}


void HelloSession::start()
{
    save_record_ = save_store_.load();
    pages_ = ContentLoader::list_pages(preferences_.pages_path(), preferences_.default_locale);

    const LocaleId locale = LocaleResolver::resolve(save_record_.locale,
                                                    environment_.system_locale,
                                                    preferences_.default_locale,
                                                    environment_.asset_exists);
    activate(locale);

    autostart_enabled_ = autostart_.is_registered();
    if (logger_) {
        logger_->info("Session started: locale '{}', {} page(s), autostart {}",
                      current_locale_, pages_.size(), autostart_enabled_ ? "on" : "off");
    }
}


bool HelloSession::shutdown()
{
    if (shut_down_) {
        return true;
    }
    shut_down_ = true;
    return save_store_.save(save_record_);
}


LocaleId HelloSession::change_locale(const LocaleId& locale)
{
    const LocaleId requested = LocaleResolver::normalize(locale);
    const bool installed = environment_.asset_exists && environment_.asset_exists(requested);
    if (!installed && requested != preferences_.default_locale) {
        if (logger_) {
            logger_->warn("No catalog installed for '{}', keeping '{}'", requested, current_locale_);
        }
        return current_locale_;
    }
    activate(requested);
    return current_locale_;
}


void HelloSession::activate(const LocaleId& locale)
{
    current_locale_ = locale;
    save_record_.locale = locale;
    if (activate_locale_) {
        activate_locale_(locale);
    }
}


std::vector<LocaleId> HelloSession::available_locales() const
{
    std::vector<LocaleId> locales = LocaleResolver::available_locales(
        Utils::utf8_to_path(preferences_.locale_path), environment_.domain);
    if (std::find(locales.begin(), locales.end(), preferences_.default_locale) == locales.end()) {
        locales.push_back(preferences_.default_locale);
        std::sort(locales.begin(), locales.end());
    }
    return locales;
}


std::string HelloSession::page_text(const PageId& page) const
{
    return ContentLoader::load_page(preferences_.pages_path(), current_locale_,
                                    preferences_.default_locale, page);
}


AutostartResult HelloSession::set_autostart(bool desired)
{
    AutostartResult result = autostart_.set_autostart(desired);
    autostart_enabled_ = autostart_.is_registered();
    if (!result && logger_) {
        logger_->warn("Autostart switch left {} after failed change", autostart_enabled_ ? "on" : "off");
    }
    return result;
}


bool HelloSession::is_live_session() const
{
    std::error_code ec;
    const bool live_media = fs::exists(Utils::utf8_to_path(preferences_.live_path), ec);
    const bool installer = fs::is_regular_file(Utils::utf8_to_path(preferences_.installer_path), ec);
    return live_media && installer;
}


std::optional<std::string> HelloSession::url_for(const std::string& name) const
{
    if (auto it = preferences_.urls.find(name); it != preferences_.urls.end()) {
        return it->second;
    }
    return std::nullopt;
}
