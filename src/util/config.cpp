#include <fencelint/config.hpp>
#include <toml++/toml.hpp>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fencelint {

// Read an array of strings; a non-string element is an error.
static Result<std::vector<std::string>> string_array(const toml::node& node,
                                                     const std::string& key,
                                                     const std::string& origin) {
    const auto* arr = node.as_array();
    if (!arr) {
        return FencelintError{FencelintError::Config,
            "'" + key + "' must be an array of strings", "", origin, 0};
    }
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value_exact<std::string>();
        if (!s) {
            return FencelintError{FencelintError::Config,
                "'" + key + "' must contain only strings", "", origin, 0};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// Read an integer that fits in an int.
static Result<int> int_value(const toml::node& node, const std::string& key,
                             const std::string& origin) {
    auto v = node.value_exact<int64_t>();
    if (!v) {
        return FencelintError{FencelintError::Config,
            "'" + key + "' must be an integer", "", origin, 0};
    }
    if (*v > INT_MAX || *v < INT_MIN) {
        return FencelintError{FencelintError::Config,
            "'" + key + "' is out of range: " + std::to_string(*v), "", origin, 0};
    }
    return Result<int>::ok(static_cast<int>(*v));
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return FencelintError{FencelintError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    for (const auto& [key, val] : doc) {
        std::string k(key.str());
        if (k == "language") {
            auto s = val.value_exact<std::string>();
            if (!s) {
                return FencelintError{FencelintError::Config,
                    "'language' must be a string", "", origin, 0};
            }
            cfg.language = *s;
        } else if (k == "extensions" || k == "exclude") {
            auto arr = string_array(val, k, origin);
            FENCELINT_TRY(arr);
            if (k == "extensions") {
                cfg.extensions = std::move(arr).value();
            } else {
                cfg.exclude = std::move(arr).value();
            }
        } else if (k == "jobs") {
            auto v = int_value(val, k, origin);
            FENCELINT_TRY(v);
            cfg.jobs = v.value();
        } else if (k == "strict-fences" || k == "show-passing") {
            auto v = val.value_exact<bool>();
            if (!v) {
                return FencelintError{FencelintError::Config,
                    "'" + k + "' must be a boolean", "", origin, 0};
            }
            if (k == "strict-fences") {
                cfg.strict_fences = *v;
            } else {
                cfg.show_passing = *v;
            }
        } else if (k == "analyzer") {
            // handled below
        } else {
            return FencelintError{FencelintError::Config,
                "unknown config key '" + k + "'",
                "known keys: language, extensions, exclude, jobs, strict-fences, "
                "show-passing, [analyzer]",
                origin, 0};
        }
    }

    // [analyzer] section
    if (auto node = doc.get("analyzer")) {
        auto analyzer = node->as_table();
        if (!analyzer) {
            return FencelintError{FencelintError::Config,
                "'analyzer' must be a table", "", origin, 0};
        }
        for (const auto& [key, val] : *analyzer) {
            std::string k(key.str());
            if (k == "command" || k == "args") {
                auto arr = string_array(val, "analyzer." + k, origin);
                FENCELINT_TRY(arr);
                if (k == "command") {
                    if (arr.value().empty()) {
                        return FencelintError{FencelintError::Config,
                            "'analyzer.command' must not be empty", "", origin, 0};
                    }
                    cfg.analyzer_command = std::move(arr).value();
                } else {
                    cfg.analyzer_args = std::move(arr).value();
                }
            } else if (k == "config") {
                auto s = val.value_exact<std::string>();
                if (!s) {
                    return FencelintError{FencelintError::Config,
                        "'analyzer.config' must be a string", "", origin, 0};
                }
                cfg.analyzer_config = *s;
            } else if (k == "timeout") {
                auto v = int_value(val, "analyzer." + k, origin);
                FENCELINT_TRY(v);
                cfg.timeout = v.value();
            } else {
                return FencelintError{FencelintError::Config,
                    "unknown config key 'analyzer." + k + "'",
                    "known keys: command, config, args, timeout", origin, 0};
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FencelintError{FencelintError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str(), path);
    FENCELINT_TRY(cfg);

    // A relative analyzer config is relative to the file that names it
    auto& loaded = cfg.value();
    if (loaded.analyzer_config && !loaded.analyzer_config->empty()) {
        std::filesystem::path p = *loaded.analyzer_config;
        if (p.is_relative()) {
            auto dir = std::filesystem::path(path).parent_path();
            loaded.analyzer_config = (dir / p).lexically_normal().string();
        }
    }
    return cfg;
}

template<typename T>
static void override_with(std::optional<T>& field, const std::optional<T>& other) {
    if (other.has_value()) field = other;
}

void Config::merge(const Config& other) {
    override_with(language, other.language);
    override_with(extensions, other.extensions);
    override_with(exclude, other.exclude);
    override_with(jobs, other.jobs);
    override_with(strict_fences, other.strict_fences);
    override_with(show_passing, other.show_passing);
    override_with(analyzer_command, other.analyzer_command);
    override_with(analyzer_config, other.analyzer_config);
    override_with(analyzer_args, other.analyzer_args);
    override_with(timeout, other.timeout);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

Result<Settings> Config::resolve() const {
    Settings s;

    auto lang = find_language(language.value_or("python"));
    FENCELINT_TRY(lang);
    s.language = lang.value();

    if (extensions.has_value()) {
        if (extensions->empty()) {
            return FencelintError{FencelintError::Config,
                "'extensions' must list at least one extension"};
        }
        s.discover.extensions.clear();
        for (const auto& ext : *extensions) {
            s.discover.extensions.push_back(!ext.empty() && ext[0] != '.' ? "." + ext : ext);
        }
    }
    if (exclude.has_value()) s.discover.exclude = *exclude;

    if (jobs.has_value()) {
        if (*jobs < 1) {
            return FencelintError{FencelintError::Config,
                "'jobs' must be at least 1, got " + std::to_string(*jobs)};
        }
        s.run.jobs = static_cast<size_t>(*jobs);
    }
    s.run.strict_fences = strict_fences.value_or(false);
    s.show_passing = show_passing.value_or(false);

    if (analyzer_command.has_value()) s.analyzer.command = *analyzer_command;
    if (analyzer_args.has_value()) s.analyzer.extra_args = *analyzer_args;
    if (timeout.has_value()) {
        if (*timeout < 1) {
            return FencelintError{FencelintError::Config,
                "'analyzer.timeout' must be at least 1 second, got " +
                std::to_string(*timeout)};
        }
        s.analyzer.timeout_seconds = *timeout;
    }
    if (analyzer_config.has_value()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*analyzer_config, ec)) {
            return FencelintError{FencelintError::Config,
                "analyzer configuration not found: " + *analyzer_config,
                "check the --analyzer-config path"};
        }
        s.analyzer.config_path = *analyzer_config;
    }

    return Result<Settings>::ok(std::move(s));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.fencelint/config.toml";
}

} // namespace fencelint
