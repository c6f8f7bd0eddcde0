#include <catch2/catch.hpp>
#include <fencelint/config.hpp>
#include "test_helpers.hpp"

using namespace fencelint;
using fencelint::testing::TempDir;

// ===== Parsing =====

TEST_CASE("parse config with top-level keys", "[config]") {
    auto r = Config::parse(R"(
language = "cpp"
extensions = [".md", ".markdown"]
exclude = ["slides", "vendor"]
jobs = 4
strict-fences = true
show-passing = true
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.language == std::string("cpp"));
    REQUIRE(c.extensions->size() == 2);
    REQUIRE(c.exclude->at(1) == "vendor");
    REQUIRE(c.jobs == 4);
    REQUIRE(c.strict_fences == true);
    REQUIRE(c.show_passing == true);
}

TEST_CASE("parse config with analyzer section", "[config]") {
    auto r = Config::parse(R"(
[analyzer]
command = ["python3", "-m", "flake8"]
args = ["--max-line-length=100"]
timeout = 30
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.analyzer_command->size() == 3);
    REQUIRE(c.analyzer_command->at(2) == "flake8");
    REQUIRE(c.analyzer_args->front() == "--max-line-length=100");
    REQUIRE(c.timeout == 30);
    REQUIRE_FALSE(c.language.has_value());
}

TEST_CASE("empty config leaves everything unset", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().language.has_value());
    REQUIRE_FALSE(r.value().jobs.has_value());
    REQUIRE_FALSE(r.value().analyzer_command.has_value());
}

TEST_CASE("invalid TOML is a parse error", "[config]") {
    auto r = Config::parse("language = \"python", "broken.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::Parse);
    REQUIRE(r.error().file == "broken.toml");
}

TEST_CASE("wrong value types are config errors", "[config]") {
    REQUIRE(Config::parse("jobs = \"four\"").error().code == FencelintError::Config);
    REQUIRE(Config::parse("exclude = \"slides\"").error().code == FencelintError::Config);
    REQUIRE(Config::parse("extensions = [1, 2]").error().code == FencelintError::Config);
    REQUIRE(Config::parse("strict-fences = 1").error().code == FencelintError::Config);
    REQUIRE(Config::parse("analyzer = 3").error().code == FencelintError::Config);
    REQUIRE(Config::parse("[analyzer]\ncommand = []").error().code == FencelintError::Config);
}

TEST_CASE("integers outside the int range are rejected", "[config]") {
    auto jobs = Config::parse("jobs = 4294967297");
    REQUIRE(jobs.is_err());
    REQUIRE(jobs.error().code == FencelintError::Config);
    REQUIRE(jobs.error().message.find("out of range") != std::string::npos);

    auto timeout = Config::parse("[analyzer]\ntimeout = -9999999999");
    REQUIRE(timeout.is_err());
    REQUIRE(timeout.error().message.find("analyzer.timeout") != std::string::npos);

    REQUIRE(Config::parse("jobs = 2147483647").value().jobs == 2147483647);
}

TEST_CASE("unknown keys are rejected", "[config]") {
    auto r = Config::parse("langauge = \"python\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("langauge") != std::string::npos);

    auto r2 = Config::parse("[analyzer]\nbinary = \"flake8\"");
    REQUIRE(r2.is_err());
    REQUIRE(r2.error().message.find("analyzer.binary") != std::string::npos);
}

TEST_CASE("load missing config file is IO error", "[config]") {
    auto r = Config::load("/nonexistent/.fencelint.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::IO);
}

TEST_CASE("load config from disk", "[config]") {
    TempDir td;
    auto path = td.write_file(".fencelint.toml", "language = \"cpp\"\n");
    auto r = Config::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().language == std::string("cpp"));
}

TEST_CASE("relative analyzer config is relative to the config file", "[config]") {
    TempDir td;
    auto flake8 = td.write_file("lint/.flake8", "[flake8]\n");
    auto path = td.write_file("docs/.fencelint.toml",
                              "[analyzer]\nconfig = \"../lint/.flake8\"\n");

    auto r = Config::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().analyzer_config ==
            std::filesystem::path(flake8).lexically_normal().string());

    auto settings = r.value().resolve();
    REQUIRE(settings.is_ok());
}

TEST_CASE("absolute analyzer config is kept as written", "[config]") {
    TempDir td;
    auto path = td.write_file(".fencelint.toml",
                              "[analyzer]\nconfig = \"/etc/fencelint/setup.cfg\"\n");
    auto r = Config::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().analyzer_config == "/etc/fencelint/setup.cfg");
}

// ===== Layering =====

TEST_CASE("merge overrides only set fields", "[config]") {
    Config base;
    base.language = "python";
    base.jobs = 2;
    base.exclude = std::vector<std::string>{"slides"};

    Config over;
    over.jobs = 8;

    base.merge(over);
    REQUIRE(base.language == std::string("python"));
    REQUIRE(base.jobs == 8);
    REQUIRE(base.exclude->front() == "slides");
}

TEST_CASE("effective config: command line wins over project over global", "[config]") {
    Config global;
    global.language = "cpp";
    global.timeout = 10;
    global.jobs = 2;

    Config project;
    project.language = "python";
    project.timeout = 20;

    Config cli;
    cli.timeout = 30;

    auto eff = Config::effective(global, project, cli);
    REQUIRE(eff.language == std::string("python"));
    REQUIRE(eff.timeout == 30);
    REQUIRE(eff.jobs == 2);

    auto only_global = Config::effective(global, std::nullopt, std::nullopt);
    REQUIRE(only_global.language == std::string("cpp"));
}

// ===== Resolution =====

TEST_CASE("resolve fills defaults", "[config]") {
    auto r = Config{}.resolve();
    REQUIRE(r.is_ok());
    const auto& s = r.value();
    REQUIRE(s.language->id == LanguageId::Python);
    REQUIRE(s.discover.extensions == std::vector<std::string>{".md"});
    REQUIRE(s.discover.exclude == std::vector<std::string>{"slides"});
    REQUIRE(s.run.jobs == 1);
    REQUIRE_FALSE(s.run.strict_fences);
    REQUIRE(s.analyzer.timeout_seconds == 60);
    REQUIRE(s.analyzer.command.empty());
    REQUIRE(s.analyzer.config_path.empty());
}

TEST_CASE("resolve rejects an unsupported language", "[config]") {
    Config c;
    c.language = "rust";
    auto r = c.resolve();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::Config);
    REQUIRE(r.error().hint.find("python") != std::string::npos);
}

TEST_CASE("resolve accepts language aliases", "[config]") {
    Config c;
    c.language = "C++";
    REQUIRE(c.resolve().value().language->id == LanguageId::Cpp);
}

TEST_CASE("resolve rejects a missing analyzer config", "[config]") {
    Config c;
    c.analyzer_config = "/nonexistent/.flake8";
    auto r = c.resolve();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FencelintError::Config);
}

TEST_CASE("resolve keeps an existing analyzer config", "[config]") {
    TempDir td;
    auto path = td.write_file(".flake8", "[flake8]\nmax-line-length = 100\n");
    Config c;
    c.analyzer_config = path;
    auto r = c.resolve();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().analyzer.config_path == path);
}

TEST_CASE("resolve validates numbers", "[config]") {
    Config jobs;
    jobs.jobs = 0;
    REQUIRE(jobs.resolve().is_err());

    Config timeout;
    timeout.timeout = -5;
    REQUIRE(timeout.resolve().is_err());
}

TEST_CASE("resolve normalizes extensions without a dot", "[config]") {
    Config c;
    c.extensions = std::vector<std::string>{"md", ".rst"};
    auto r = c.resolve();
    REQUIRE(r.value().discover.extensions == std::vector<std::string>{".md", ".rst"});
}

TEST_CASE("global_config_path under HOME", "[config]") {
    auto p = global_config_path();
    if (std::getenv("HOME")) {
        REQUIRE(p.find(".fencelint/config.toml") != std::string::npos);
    }
}
