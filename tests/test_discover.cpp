#include <catch2/catch.hpp>
#include <fencelint/discover.hpp>
#include "test_helpers.hpp"

using namespace fencelint;
using fencelint::testing::TempDir;
namespace fs = std::filesystem;

static std::vector<std::string> relative_names(const std::vector<std::string>& paths,
                                               const fs::path& root) {
    std::vector<std::string> out;
    for (const auto& p : paths) out.push_back(fs::relative(p, root).generic_string());
    return out;
}

TEST_CASE("is_excluded matches whole path segments", "[discover]") {
    std::vector<std::string> exclude = {"slides"};
    REQUIRE(is_excluded("slides/intro.md", exclude));
    REQUIRE(is_excluded("course/slides/week1/intro.md", exclude));
    REQUIRE_FALSE(is_excluded("course/slideshow/intro.md", exclude));
    REQUIRE_FALSE(is_excluded("course/slides.md", exclude));
    REQUIRE_FALSE(is_excluded("docs/intro.md", {}));
}

TEST_CASE("has_extension compares the final extension", "[discover]") {
    std::vector<std::string> exts = {".md", ".markdown"};
    REQUIRE(has_extension("a/b/readme.md", exts));
    REQUIRE(has_extension("notes.markdown", exts));
    REQUIRE_FALSE(has_extension("script.py", exts));
    REQUIRE_FALSE(has_extension("Makefile", exts));
    REQUIRE_FALSE(has_extension("archive.md.bak", exts));
}

TEST_CASE("find_documents walks, filters and sorts", "[discover]") {
    TempDir td;
    td.write_file("README.md", "# readme\n");
    td.write_file("docs/guide.md", "guide\n");
    td.write_file("docs/api/ref.md", "ref\n");
    td.write_file("docs/script.py", "x = 1\n");
    td.write_file("slides/week1.md", "excluded\n");
    td.write_file("course/slides/deep/week2.md", "excluded\n");

    auto r = find_documents(td.path, DiscoverOptions{});
    REQUIRE(r.is_ok());
    auto names = relative_names(r.value(), td.path);
    REQUIRE(names == std::vector<std::string>{"README.md", "docs/api/ref.md", "docs/guide.md"});
}

TEST_CASE("find_documents honors custom extensions and markers", "[discover]") {
    TempDir td;
    td.write_file("a.md", "");
    td.write_file("b.rst", "");
    td.write_file("drafts/c.rst", "");

    DiscoverOptions opts;
    opts.extensions = {".rst"};
    opts.exclude = {"drafts"};
    auto r = find_documents(td.path, opts);
    REQUIRE(r.is_ok());
    REQUIRE(relative_names(r.value(), td.path) == std::vector<std::string>{"b.rst"});
}

TEST_CASE("find_documents accepts a single file", "[discover]") {
    TempDir td;
    auto md = td.write_file("one.md", "text\n");
    auto txt = td.write_file("one.txt", "text\n");

    auto r = find_documents(md, DiscoverOptions{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{md});

    auto r2 = find_documents(txt, DiscoverOptions{});
    REQUIRE(r2.is_ok());
    REQUIRE(r2.value().empty());
}

TEST_CASE("find_documents skips a root inside an excluded directory", "[discover]") {
    TempDir td;
    auto deck = td.write_file("slides/deck.md", "```python\nx=1\n```\n");
    td.write_file("slides/week1/intro.md", "intro\n");

    auto file_root = find_documents(deck, DiscoverOptions{});
    REQUIRE(file_root.is_ok());
    REQUIRE(file_root.value().empty());

    auto dir_root = find_documents(td.path / "slides", DiscoverOptions{});
    REQUIRE(dir_root.is_ok());
    REQUIRE(dir_root.value().empty());

    auto nested = find_documents(td.path / "slides" / "week1" / ".." / "week1", DiscoverOptions{});
    REQUIRE(nested.is_ok());
    REQUIRE(nested.value().empty());
}

TEST_CASE("find_all_documents lists overlapping roots once", "[discover]") {
    TempDir td;
    auto a = td.write_file("docs/a.md", "a\n");
    auto b = td.write_file("docs/b.md", "b\n");
    auto readme = td.write_file("README.md", "r\n");

    auto docs_dir = (td.path / "docs").string();
    auto dotted = (td.path / "docs" / "." / "a.md").string();
    auto r = find_all_documents({docs_dir, a, dotted, readme}, DiscoverOptions{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{a, b, readme});
}

TEST_CASE("find_all_documents stops at the first bad root", "[discover]") {
    TempDir td;
    auto a = td.write_file("a.md", "a\n");
    auto r = find_all_documents({a, "/nonexistent/fencelint/docs"}, DiscoverOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::IO);
}

TEST_CASE("find_documents on a missing path is an IO error", "[discover]") {
    auto r = find_documents("/nonexistent/fencelint/docs", DiscoverOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::IO);
}
