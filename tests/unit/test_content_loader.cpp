#include <catch2/catch_test_macros.hpp>

#include "ContentLoader.hpp"
#include "TestHelpers.hpp"

#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("page is served in the requested locale when present") {
    TempDir temp;
    write_text_file(temp.path() / "en" / "about", "About text");
    write_text_file(temp.path() / "fr" / "about", "Texte à propos");

    REQUIRE(ContentLoader::load_page(temp.path(), "fr", "en", "about") == "Texte à propos");
}

TEST_CASE("missing translation falls back to the default locale") {
    TempDir temp;
    write_text_file(temp.path() / "en" / "about", "About text");

    REQUIRE(ContentLoader::load_page(temp.path(), "fr", "en", "about") == "About text");
}

TEST_CASE("missing page in every locale yields the unavailable message") {
    TempDir temp;
    std::filesystem::create_directories(temp.path() / "en");

    REQUIRE(ContentLoader::load_page(temp.path(), "fr", "en", "about") == "Can't load page.");
    REQUIRE(ContentLoader::load_page(temp.path() / "missing", "fr", "en", "about") == "Can't load page.");
}

TEST_CASE("a directory in place of the page counts as missing") {
    TempDir temp;
    std::filesystem::create_directories(temp.path() / "fr" / "about");
    write_text_file(temp.path() / "en" / "about", "About text");

    REQUIRE(ContentLoader::load_page(temp.path(), "fr", "en", "about") == "About text");
}

TEST_CASE("loader consults the locale first and the default second") {
    std::vector<fs::path> requested;
    const ContentLoader::FileReader reader = [&requested](const fs::path& path) -> std::optional<std::string> {
        requested.push_back(path);
        return std::nullopt;
    };

    const fs::path root = "/pages";
    ContentLoader::load_page(root, "de", "en", "readme", reader);
    REQUIRE(requested == std::vector<fs::path>{root / "de" / "readme", root / "en" / "readme"});
}

TEST_CASE("reader exceptions degrade to the fallback chain") {
    const ContentLoader::FileReader reader = [](const fs::path& path) -> std::optional<std::string> {
        if (path.parent_path().filename() == "de") {
            throw std::runtime_error("I/O error");
        }
        return std::string("default body");
    };

    REQUIRE(ContentLoader::load_page("/pages", "de", "en", "readme", reader) == "default body");

    const ContentLoader::FileReader broken = [](const fs::path&) -> std::optional<std::string> {
        throw std::runtime_error("I/O error");
    };
    REQUIRE(ContentLoader::load_page("/pages", "de", "en", "readme", broken) == "Can't load page.");
}

TEST_CASE("pages are re-read on every call") {
    TempDir temp;
    write_text_file(temp.path() / "en" / "readme", "first");
    REQUIRE(ContentLoader::load_page(temp.path(), "en", "en", "readme") == "first");

    write_text_file(temp.path() / "en" / "readme", "second");
    REQUIRE(ContentLoader::load_page(temp.path(), "en", "en", "readme") == "second");
}

TEST_CASE("page list comes from the default locale directory") {
    TempDir temp;
    write_text_file(temp.path() / "en" / "release", "r");
    write_text_file(temp.path() / "en" / "involved", "i");
    write_text_file(temp.path() / "en" / "readme", "m");
    write_text_file(temp.path() / "fr" / "extra", "x");
    std::filesystem::create_directories(temp.path() / "en" / "images");

    REQUIRE(ContentLoader::list_pages(temp.path(), "en") ==
            std::vector<PageId>{"involved", "readme", "release"});
}

TEST_CASE("page list is empty when the default locale directory is missing") {
    TempDir temp;
    REQUIRE(ContentLoader::list_pages(temp.path(), "en").empty());
}
