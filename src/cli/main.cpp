// fencelint: lint fenced code blocks in documentation files.
//
//     fencelint                         # python blocks under the current directory
//     fencelint -l cpp docs README.md   # cpp blocks in docs/ and README.md
//     fencelint -c .flake8 -j 8 .
//
// Exit status: 0 clean, 1 diagnostics found, 2 usage or configuration error.

#include <fencelint/config.hpp>
#include <fencelint/core/analyzer.hpp>
#include <fencelint/core/report.hpp>
#include <fencelint/core/runner.hpp>
#include <fencelint/discover.hpp>
#include <fencelint/log.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace fencelint;

static const char* kVersion = "0.3.0";

constexpr int kExitClean = 0;
constexpr int kExitFindings = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
    Config layer;
    std::vector<std::string> paths;
    std::optional<std::string> config_file;
    int verbosity = 0;
    std::optional<bool> color;
    bool help = false;
    bool version = false;
};

static void print_usage(std::ostream& out) {
    out << "usage: fencelint [options] [path...]\n"
           "\n"
           "Lint fenced code blocks embedded in documentation files.\n"
           "Paths may be directories (searched recursively) or files; default is '.'.\n"
           "\n"
           "options:\n"
           "  -l, --language NAME        content language to lint (" << language_names() << ")\n"
           "  -c, --analyzer-config FILE configuration file passed to the analyzer\n"
           "      --config FILE          fencelint config (default: <path>/" << kProjectConfigName << ")\n"
           "  -j, --jobs N               documents checked in parallel\n"
           "      --timeout SECONDS      analyzer timeout per document\n"
           "      --ext EXT              accepted document extension (repeatable)\n"
           "      --exclude NAME         skip paths with a segment named NAME (repeatable)\n"
           "      --strict-fences        fail documents with unterminated fences\n"
           "      --show-passing         print a line for every clean document\n"
           "  -v, --verbose              more logging (repeat for trace)\n"
           "  -q, --quiet                errors only\n"
           "      --color / --no-color   force log colors on or off\n"
           "  -h, --help                 show this help\n"
           "      --version              show version\n";
}

static Result<int> parse_int(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size()) return Result<int>::ok(v);
    } catch (const std::exception&) {
        // fall through to the error below
    }
    return FencelintError{FencelintError::InvalidArg,
        "invalid value for " + flag + ": '" + text + "'", "expected an integer"};
}

static Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;

    auto need_value = [&](int& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= argc) {
            return FencelintError{FencelintError::InvalidArg,
                "missing value for " + flag, "see fencelint --help"};
        }
        return Result<std::string>::ok(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // --flag=value
        std::string inline_value;
        bool has_inline = false;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }
        auto value = [&](const std::string& flag) -> Result<std::string> {
            if (has_inline) return Result<std::string>::ok(inline_value);
            return need_value(i, flag);
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "--version") {
            args.version = true;
        } else if (arg == "-l" || arg == "--language") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            args.layer.language = v.value();
        } else if (arg == "-c" || arg == "--analyzer-config") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            args.layer.analyzer_config = v.value();
        } else if (arg == "--config") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            args.config_file = v.value();
        } else if (arg == "-j" || arg == "--jobs") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            auto n = parse_int(arg, v.value());
            FENCELINT_TRY(n);
            args.layer.jobs = n.value();
        } else if (arg == "--timeout") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            auto n = parse_int(arg, v.value());
            FENCELINT_TRY(n);
            args.layer.timeout = n.value();
        } else if (arg == "--ext") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            if (!args.layer.extensions) args.layer.extensions.emplace();
            args.layer.extensions->push_back(v.value());
        } else if (arg == "--exclude") {
            auto v = value(arg);
            FENCELINT_TRY(v);
            if (!args.layer.exclude) args.layer.exclude.emplace();
            args.layer.exclude->push_back(v.value());
        } else if (arg == "--strict-fences") {
            args.layer.strict_fences = true;
        } else if (arg == "--show-passing") {
            args.layer.show_passing = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++args.verbosity;
        } else if (arg == "-vv") {
            args.verbosity += 2;
        } else if (arg == "-q" || arg == "--quiet") {
            args.verbosity = -1;
        } else if (arg == "--color") {
            args.color = true;
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return FencelintError{FencelintError::InvalidArg,
                "unknown option '" + arg + "'", "see fencelint --help"};
        } else {
            args.paths.push_back(arg);
        }
    }

    if (args.paths.empty()) args.paths.push_back(".");
    return Result<CliArgs>::ok(std::move(args));
}

// Global, then project (explicit --config or <first directory>/.fencelint.toml),
// then the command line.
static Result<Settings> load_settings(const CliArgs& args) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::is_regular_file(global_path, ec)) {
        auto g = Config::load(global_path);
        FENCELINT_TRY(g);
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (args.config_file) {
        auto p = Config::load(*args.config_file);
        FENCELINT_TRY(p);
        project = std::move(p).value();
    } else {
        fs::path first = args.paths.front();
        fs::path dir = fs::is_directory(first, ec) ? first : first.parent_path();
        fs::path candidate = dir / kProjectConfigName;
        if (fs::is_regular_file(candidate, ec)) {
            auto p = Config::load(candidate.string());
            FENCELINT_TRY(p);
            log::debug("loaded project config %s", candidate.string().c_str());
            project = std::move(p).value();
        }
    }

    return Config::effective(global, project, args.layer).resolve();
}

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n";
        return kExitUsage;
    }
    auto& args = parsed.value();

    if (args.help) {
        print_usage(std::cout);
        return kExitClean;
    }
    if (args.version) {
        std::cout << "fencelint " << kVersion << "\n";
        return kExitClean;
    }

    log::set_level(log::level_for_verbosity(args.verbosity));
    if (args.color) log::set_color_enabled(*args.color);

    auto settings = load_settings(args);
    if (settings.is_err()) {
        std::cerr << settings.error().format() << "\n";
        return kExitUsage;
    }
    const auto& s = settings.value();

    auto docs = find_all_documents(args.paths, s.discover);
    if (docs.is_err()) {
        std::cerr << docs.error().format() << "\n";
        return kExitUsage;
    }
    log::info("found %zu document(s), linting %s blocks",
              docs.value().size(), s.language->name.c_str());

    CommandAnalyzer analyzer(s.language->analyzer, s.analyzer);
    TextReporter reporter(std::cout, s.show_passing);
    Runner runner(*s.language, analyzer, reporter, s.run);

    auto summary = runner.run(docs.value());
    return summary.has_failures() ? kExitFindings : kExitClean;
}
