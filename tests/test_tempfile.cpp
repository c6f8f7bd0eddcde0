#include <catch2/catch.hpp>
#include <fencelint/tempfile.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using namespace fencelint;
namespace fs = std::filesystem;

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("TempFile writes contents and keeps the extension", "[tempfile]") {
    auto r = TempFile::create("guide", ".cpp", "int main() {}\n");
    REQUIRE(r.is_ok());
    const auto& path = r.value().path();
    REQUIRE(fs::path(path).extension() == ".cpp");
    REQUIRE(fs::path(path).filename().string().rfind("fencelint-guide-", 0) == 0);
    REQUIRE(slurp(path) == "int main() {}\n");
}

TEST_CASE("TempFile is removed on destruction", "[tempfile]") {
    std::string path;
    {
        auto r = TempFile::create("gone", ".py", "x = 1\n");
        REQUIRE(r.is_ok());
        path = r.value().path();
        REQUIRE(fs::exists(path));
    }
    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("TempFile names are unique per invocation", "[tempfile]") {
    std::vector<TempFile> files;
    std::set<std::string> names;
    for (int i = 0; i < 16; ++i) {
        auto r = TempFile::create("same", ".py", "");
        REQUIRE(r.is_ok());
        names.insert(r.value().path());
        files.push_back(std::move(r).value());
    }
    REQUIRE(names.size() == 16);
}

TEST_CASE("TempFile move transfers ownership", "[tempfile]") {
    auto r = TempFile::create("moved", ".py", "pass\n");
    REQUIRE(r.is_ok());
    TempFile a = std::move(r).value();
    std::string path = a.path();
    TempFile b = std::move(a);
    REQUIRE(b.path() == path);
    REQUIRE(a.path().empty());
    REQUIRE(fs::exists(path));
}

TEST_CASE("TempFile sanitizes the stem", "[tempfile]") {
    auto r = TempFile::create("my doc/../x", ".py", "");
    REQUIRE(r.is_ok());
    auto name = fs::path(r.value().path()).filename().string();
    REQUIRE(name.find(' ') == std::string::npos);
    REQUIRE(name.find('/') == std::string::npos);
}
