#include <catch2/catch_test_macros.hpp>

#include "Utils.hpp"
#include "TestHelpers.hpp"

#include <sstream>

TEST_CASE("expand_user_path replaces every tilde with HOME") {
    EnvVarGuard home("HOME", std::string("/home/tester"));

    REQUIRE(Utils::expand_user_path("~/.config/save.json") == "/home/tester/.config/save.json");
    REQUIRE(Utils::expand_user_path("/usr/share/distro-hello") == "/usr/share/distro-hello");
    REQUIRE(Utils::expand_user_path("~/a:~/b") == "/home/tester/a:/home/tester/b");
    REQUIRE(Utils::expand_user_path("").empty());
}

TEST_CASE("expand_user_path leaves the path alone without HOME") {
    EnvVarGuard home("HOME", std::nullopt);
    REQUIRE(Utils::expand_user_path("~/.config") == "~/.config");
}

TEST_CASE("utf8 paths survive conversion") {
    const std::string name = "/tmp/\xC3\xA9t\xC3\xA9/page";
    REQUIRE(Utils::path_to_utf8(Utils::utf8_to_path(name)) == name);
}

TEST_CASE("lsb-release entries are parsed without prefix and quotes") {
    std::istringstream input(
        "DISTRIB_ID=\"Distro\"\n"
        "DISTRIB_RELEASE=21.0.3\r\n"
        "DISTRIB_CODENAME=\"Ruah\"\n"
        "DISTRIB_DESCRIPTION=\"Distro Linux\"\n"
        "garbage line\n");

    const auto info = Utils::parse_lsb_release(input);
    REQUIRE(info.has_value());
    CHECK(info->codename == "Ruah");
    CHECK(info->release == "21.0.3");
}

TEST_CASE("lsb-release without codename is rejected") {
    std::istringstream input("DISTRIB_RELEASE=21.0\n");
    REQUIRE_FALSE(Utils::parse_lsb_release(input).has_value());
}

TEST_CASE("read_lsb_release falls back for missing or incomplete files") {
    TempDir temp;

    const LsbInfo missing = Utils::read_lsb_release((temp.path() / "lsb-release").string());
    CHECK(missing.codename == "unknown");
    CHECK(missing.release == "0.0");

    write_text_file(temp.path() / "partial", "DISTRIB_ID=Distro\n");
    const LsbInfo partial = Utils::read_lsb_release((temp.path() / "partial").string());
    CHECK(partial.codename == "unknown");
    CHECK(partial.release == "0.0");

    write_text_file(temp.path() / "full", "DISTRIB_RELEASE=22.1\nDISTRIB_CODENAME=Wynsdey\n");
    const LsbInfo full = Utils::read_lsb_release((temp.path() / "full").string());
    CHECK(full.codename == "Wynsdey");
    CHECK(full.release == "22.1");
}
