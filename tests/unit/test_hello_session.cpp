#include <catch2/catch_test_macros.hpp>

#include "HelloSession.hpp"
#include "TestHelpers.hpp"

#include <set>

namespace fs = std::filesystem;

namespace {
struct SessionFixture {
    TempDir temp;
    Preferences prefs;
    std::set<LocaleId> installed{"fr", "de", "pt-BR"};
    std::vector<LocaleId> activations;

    SessionFixture() {
        prefs.default_locale = "en";
        prefs.data_path = (temp.path() / "data").string();
        prefs.locale_path = (temp.path() / "locale").string();
        prefs.save_path = (temp.path() / "config" / "save.json").string();
        prefs.autostart_path = (temp.path() / "autostart" / "distro-hello.desktop").string();
        prefs.desktop_path = (temp.path() / "distro-hello.desktop").string();
        prefs.live_path = (temp.path() / "live").string();
        prefs.installer_path = (temp.path() / "bin" / "installer").string();
        prefs.urls["wiki"] = "https://wiki.example.org";

        write_text_file(temp.path() / "data" / "pages" / "en" / "readme", "Readme");
        write_text_file(temp.path() / "data" / "pages" / "en" / "release", "Release");
        write_text_file(temp.path() / "data" / "pages" / "fr" / "readme", "Lisez-moi");
        write_text_file(temp.path() / "distro-hello.desktop", "[Desktop Entry]\n");
        for (const auto& locale : installed) {
            install_catalog(temp.path() / "locale", locale);
        }
    }

    HelloSession make_session(const LocaleId& system_locale = "") {
        HelloSession::Environment environment;
        environment.system_locale = system_locale;
        environment.asset_exists = [this](const LocaleId& id) { return installed.count(id) > 0; };
        environment.domain = "distro-hello";
        return HelloSession(prefs, environment,
                            [this](const LocaleId& id) { activations.push_back(id); });
    }

    void write_saved_locale(const std::string& json) {
        write_text_file(prefs.save_path, json);
    }
};
}

TEST_CASE("first run follows the system locale") {
    SessionFixture fx;
    auto session = fx.make_session("fr_FR");
    session.start();

    CHECK(session.current_locale() == "fr");
    CHECK(fx.activations == std::vector<LocaleId>{"fr"});
    CHECK(session.pages() == std::vector<PageId>{"readme", "release"});
    CHECK(session.page_text("readme") == "Lisez-moi");
    CHECK(session.page_text("release") == "Release");
}

TEST_CASE("saved locale wins over the system locale") {
    SessionFixture fx;
    fx.write_saved_locale("{\"locale\":\"de\"}");
    auto session = fx.make_session("fr_FR");
    session.start();

    CHECK(session.current_locale() == "de");
}

TEST_CASE("unknown system locale falls back to the default") {
    SessionFixture fx;
    auto session = fx.make_session("xx_YY");
    session.start();

    CHECK(session.current_locale() == "en");
    CHECK(session.page_text("readme") == "Readme");
}

TEST_CASE("changing the locale is persisted on shutdown only") {
    SessionFixture fx;
    auto session = fx.make_session();
    session.start();

    CHECK(session.change_locale("pt_BR") == "pt-BR");
    CHECK_FALSE(fs::exists(fx.prefs.save_path));

    REQUIRE(session.shutdown());
    CHECK(SaveStore(fx.prefs.save_path).load().locale == std::optional<LocaleId>("pt-BR"));

    fx.write_saved_locale("{\"locale\":\"fr\"}");
    REQUIRE(session.shutdown());
    CHECK(SaveStore(fx.prefs.save_path).load().locale == std::optional<LocaleId>("fr"));
}

TEST_CASE("locales without a catalog are refused") {
    SessionFixture fx;
    auto session = fx.make_session("de_DE");
    session.start();

    CHECK(session.change_locale("ja") == "de");
    CHECK(session.current_locale() == "de");
    CHECK(session.change_locale("en") == "en");
    CHECK(fx.activations == std::vector<LocaleId>{"de", "en"});
}

TEST_CASE("available locales always include the default") {
    SessionFixture fx;
    auto session = fx.make_session();

    CHECK(session.available_locales() == std::vector<LocaleId>{"de", "en", "fr", "pt-BR"});
}

TEST_CASE("autostart toggle reflects the state on disk") {
    SessionFixture fx;
    auto session = fx.make_session();
    session.start();
    CHECK_FALSE(session.autostart_enabled());

    REQUIRE(session.set_autostart(true).success);
    CHECK(session.autostart_enabled());
    CHECK(fs::is_symlink(fx.prefs.autostart_path));

    REQUIRE(session.set_autostart(false).success);
    CHECK_FALSE(session.autostart_enabled());
    CHECK_FALSE(fs::exists(fs::symlink_status(fx.prefs.autostart_path)));
}

TEST_CASE("failed autostart change keeps the switch on the real state") {
    SessionFixture fx;
    write_text_file(fs::path(fx.prefs.autostart_path).parent_path(), "not a directory");
    auto session = fx.make_session();
    session.start();

    const auto result = session.set_autostart(true);
    CHECK_FALSE(result.success);
    CHECK_FALSE(session.autostart_enabled());
}

TEST_CASE("live session needs both the live medium and the installer") {
    SessionFixture fx;
    auto session = fx.make_session();
    CHECK_FALSE(session.is_live_session());

    fs::create_directories(fx.prefs.live_path);
    CHECK_FALSE(session.is_live_session());

    write_text_file(fx.prefs.installer_path, "#!/bin/sh\n");
    CHECK(session.is_live_session());
}

TEST_CASE("link names resolve through the preferences") {
    SessionFixture fx;
    auto session = fx.make_session();

    CHECK(session.url_for("wiki") == std::optional<std::string>("https://wiki.example.org"));
    CHECK_FALSE(session.url_for("donate").has_value());
}
