#include <catch2/catch_test_macros.hpp>

#include "LocaleResolver.hpp"
#include "TestHelpers.hpp"

#include <set>
#include <stdexcept>

namespace {
LocaleResolver::AssetProbe probe_for(std::set<LocaleId> installed)
{
    return [installed = std::move(installed)](const LocaleId& id) {
        return installed.count(id) > 0;
    };
}
}

TEST_CASE("saved locale with a catalog wins over the system locale") {
    const auto exists = probe_for({"de", "fr", "en-US"});
    REQUIRE(LocaleResolver::resolve(std::string("de"), "fr_FR", "en", exists) == "de");
    REQUIRE(LocaleResolver::resolve(std::string("en-US"), "", "en", exists) == "en-US");
}

TEST_CASE("saved default locale is kept even without a catalog") {
    const auto exists = probe_for({"fr"});
    REQUIRE(LocaleResolver::resolve(std::string("en"), "fr_FR", "en", exists) == "en");
}

TEST_CASE("saved locale without a catalog falls through to the system locale") {
    const auto exists = probe_for({"fr"});
    REQUIRE(LocaleResolver::resolve(std::string("xx"), "fr_FR", "en", exists) == "fr");
}

TEST_CASE("territory-qualified system locale is returned in hyphen form") {
    const auto exists = probe_for({"en-US", "en"});
    REQUIRE(LocaleResolver::resolve(std::nullopt, "en_US", "de", exists) == "en-US");
}

TEST_CASE("bare language is used when the territory variant is missing") {
    const auto exists = probe_for({"pt"});
    REQUIRE(LocaleResolver::resolve(std::nullopt, "pt_BR", "en", exists) == "pt");
}

TEST_CASE("unknown system locale resolves to the default") {
    const auto exists = probe_for({"fr", "de"});
    REQUIRE(LocaleResolver::resolve(std::nullopt, "xx_YY", "en", exists) == "en");
    REQUIRE(LocaleResolver::resolve(std::nullopt, "xx_YY", "zz", exists) == "zz");
}

TEST_CASE("empty system locale skips straight to the default") {
    int probes = 0;
    const LocaleResolver::AssetProbe exists = [&probes](const LocaleId&) {
        ++probes;
        return true;
    };
    REQUIRE(LocaleResolver::resolve(std::nullopt, "", "en", exists) == "en");
    REQUIRE(probes == 0);
}

TEST_CASE("resolver never returns a locale without a catalog other than the default") {
    const auto installed = std::set<LocaleId>{"de", "fr-CA", "it"};
    const auto exists = probe_for(installed);
    const std::vector<std::optional<LocaleId>> saved_values{
        std::nullopt, std::string("de"), std::string("es"), std::string("en"), std::string("")};
    const std::vector<LocaleId> system_values{
        "", "fr_CA", "fr_FR", "it_IT", "de", "C", "x", "es_ES"};

    for (const auto& saved : saved_values) {
        for (const auto& system : system_values) {
            const LocaleId result = LocaleResolver::resolve(saved, system, "en", exists);
            CHECK((result == "en" || installed.count(result) == 1));
        }
    }
}

TEST_CASE("a throwing probe is treated as a missing catalog") {
    const LocaleResolver::AssetProbe exists = [](const LocaleId&) -> bool {
        throw std::runtime_error("disk on fire");
    };
    REQUIRE(LocaleResolver::resolve(std::string("de"), "fr_FR", "en", exists) == "en");
}

TEST_CASE("normalize and to_posix swap territory separators") {
    REQUIRE(LocaleResolver::normalize("en_US") == "en-US");
    REQUIRE(LocaleResolver::normalize("en") == "en");
    REQUIRE(LocaleResolver::to_posix("zh-TW") == "zh_TW");
}

TEST_CASE("system locale is read from the environment without codeset") {
    EnvVarGuard lc_all("LC_ALL", std::nullopt);
    EnvVarGuard lc_messages("LC_MESSAGES", std::nullopt);

    {
        EnvVarGuard lang("LANG", std::string("de_DE.UTF-8"));
        REQUIRE(LocaleResolver::system_locale_from_environment() == "de_DE");
    }
    {
        EnvVarGuard lang("LANG", std::string("ca_ES@valencia"));
        REQUIRE(LocaleResolver::system_locale_from_environment() == "ca_ES");
    }
    {
        EnvVarGuard lang("LANG", std::string("C.UTF-8"));
        REQUIRE(LocaleResolver::system_locale_from_environment().empty());
    }
    {
        EnvVarGuard lang("LANG", std::nullopt);
        REQUIRE(LocaleResolver::system_locale_from_environment().empty());
    }
}

TEST_CASE("LC_ALL takes precedence over LANG") {
    EnvVarGuard lc_all("LC_ALL", std::string("fr_FR.UTF-8"));
    EnvVarGuard lang("LANG", std::string("de_DE.UTF-8"));
    REQUIRE(LocaleResolver::system_locale_from_environment() == "fr_FR");
}

TEST_CASE("catalog probe finds catalogs under either separator") {
    TempDir temp;
    install_catalog(temp.path(), "pt-BR");
    install_catalog(temp.path(), "en_GB");
    install_catalog(temp.path(), "de");

    const auto exists = LocaleResolver::make_catalog_probe(temp.path(), "distro-hello");
    CHECK(exists("pt-BR"));
    CHECK(exists("pt_BR"));
    CHECK(exists("en-GB"));
    CHECK(exists("de"));
    CHECK_FALSE(exists("fr"));
    CHECK_FALSE(exists(""));
    CHECK_FALSE(exists("../de"));

    REQUIRE(LocaleResolver::resolve(std::nullopt, "pt_BR", "en", exists) == "pt-BR");
    REQUIRE(LocaleResolver::resolve(std::nullopt, "en_GB", "fr", exists) == "en-GB");
}

TEST_CASE("available locales lists installed catalogs in hyphen form") {
    TempDir temp;
    install_catalog(temp.path(), "fr");
    install_catalog(temp.path(), "en_GB");
    install_catalog(temp.path(), "de");
    std::filesystem::create_directories(temp.path() / "it" / "LC_MESSAGES");

    const auto locales = LocaleResolver::available_locales(temp.path(), "distro-hello");
    REQUIRE(locales == std::vector<LocaleId>{"de", "en-GB", "fr"});
}

TEST_CASE("available locales is empty for a missing root") {
    TempDir temp;
    REQUIRE(LocaleResolver::available_locales(temp.path() / "missing", "distro-hello").empty());
}
