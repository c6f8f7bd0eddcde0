#pragma once

#include <fencelint/core/analyzer.hpp>
#include <fencelint/core/language.hpp>
#include <fencelint/core/runner.hpp>
#include <fencelint/discover.hpp>
#include <fencelint/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fencelint {

// Settings after layering and validation
struct Settings {
    const Language* language = nullptr;
    DiscoverOptions discover;
    RunOptions run;
    AnalyzerSettings analyzer;
    bool show_passing = false;
};

// One configuration layer. Unset fields leave lower layers alone.
// Layering: global > project > command line, later layers win.
struct Config {
    std::optional<std::string> language;
    std::optional<std::vector<std::string>> extensions;
    std::optional<std::vector<std::string>> exclude;
    std::optional<int> jobs;
    std::optional<bool> strict_fences;
    std::optional<bool> show_passing;

    // [analyzer]
    std::optional<std::vector<std::string>> analyzer_command;
    std::optional<std::string> analyzer_config;
    std::optional<std::vector<std::string>> analyzer_args;
    std::optional<int> timeout;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string. `origin` names the source in error messages.
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<config>");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> command line
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);

    // Validate and fill defaults. Fails on an unknown language, a missing
    // analyzer configuration file or out-of-range numbers.
    Result<Settings> resolve() const;
};

// Discover the global config file path: ~/.fencelint/config.toml
std::string global_config_path();

// Name of the per-project config file looked up in the scanned directory
constexpr const char* kProjectConfigName = ".fencelint.toml";

} // namespace fencelint
