#include <hdrguard/config.hpp>
#include <hdrguard/errors.hpp>
#include <hdrguard/runner.hpp>
#include <hdrguard/util.hpp>
#include <hdrguard/workspace.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hdrguard;

static constexpr int kExitOk = 0;
static constexpr int kExitSignal = 1;
static constexpr int kExitUsage = 2;

struct Cli {
    std::vector<std::string> patterns;
    bool modify = false;
    std::optional<int> year;
    bool preserve_years = false;
    std::optional<size_t> prefix_window;
    std::optional<unsigned> jobs;
    std::optional<std::filesystem::path> license_file;
    std::vector<std::string> ignores;
    std::optional<std::filesystem::path> global_ignore_file;
    std::optional<std::string> ignore_file_name;
    std::optional<std::string> changed_since;
    bool committed_only = false;
    bool tracked_only = false;
    bool content_detection = false;
    bool show_diff = false;
    std::vector<std::string> include_exts;
    std::vector<std::string> exclude_exts;
    std::optional<std::filesystem::path> config_file;
    bool list_files = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<std::filesystem::path> log_file;
    size_t log_rotate_max = 10 * 1024 * 1024;
    size_t log_rotate_files = 3;
};

static void print_usage(const char* argv0){
    fmt::print(
        "Usage:\n"
        "  {} [--check | --modify] PATTERN...\n"
        "     [--license-file PATH] [--year YYYY | --preserve-years]\n"
        "     [--ignore PATTERN ...] [--global-ignore-file PATH] [--ignore-file-name NAME]\n"
        "     [--tracked-only] [--changed-since REF [--committed-only]]\n"
        "     [--include-ext \"rs;go\"] [--exclude-ext \"json\"]\n"
        "     [--content-detection] [--prefix-bytes N] [--jobs N]\n"
        "     [--config PATH] [--diff] [--list-files]\n"
        "     [--log-file PATH] [--log-rotate-max BYTES] [--log-rotate-files N]\n"
        "     [--verbose | --quiet]\n"
        "\n"
        "Patterns are files, directories or globs. Check mode is the default.\n"
        "Environment: {} (global ignore file), {} (config file).\n"
        "Exit status: 0 ok, 1 missing headers (check) or failures, 2 usage/config error.\n"
        "\n", argv0, kGlobalIgnoreEnv, kConfigEnv);
}

static long long parse_number(const std::string& flag, const char* value,
                              long long max = std::numeric_limits<long long>::max()){
    auto bad = [&]{ return ConfigurationError(fmt::format("{} expects a number in [0, {}], got '{}'", flag, max, value)); };
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw bad();
    }
    if (used != std::string(value).size() || v < 0 || v > max) throw bad();
    return v;
}

static std::optional<Cli> parse_cli(int argc, char** argv){
    Cli cli;
    bool mode_set = false;
    for (int i=1;i<argc;i++){
        std::string a = argv[i];
        bool has_value = (i+1<argc);
        if (a=="--check" || a=="-c") {
            if (mode_set && cli.modify) { spdlog::error("--check and --modify are mutually exclusive"); return std::nullopt; }
            mode_set = true;
        } else if (a=="--modify" || a=="-m") {
            if (mode_set && !cli.modify) { spdlog::error("--check and --modify are mutually exclusive"); return std::nullopt; }
            cli.modify = true;
            mode_set = true;
        } else if (a=="--year" && has_value) {
            cli.year = static_cast<int>(parse_number(a, argv[++i], std::numeric_limits<int>::max()));
        } else if (a=="--preserve-years") {
            cli.preserve_years = true;
        } else if (a=="--prefix-bytes" && has_value) {
            cli.prefix_window = static_cast<size_t>(parse_number(a, argv[++i]));
        } else if ((a=="--jobs" || a=="-j") && has_value) {
            cli.jobs = static_cast<unsigned>(parse_number(a, argv[++i], std::numeric_limits<unsigned>::max()));
        } else if ((a=="--license-file" || a=="-l") && has_value) {
            cli.license_file = std::filesystem::path(argv[++i]);
        } else if (a=="--ignore" && has_value) {
            cli.ignores.push_back(argv[++i]);
        } else if (a=="--global-ignore-file" && has_value) {
            cli.global_ignore_file = std::filesystem::path(argv[++i]);
        } else if (a=="--ignore-file-name" && has_value) {
            cli.ignore_file_name = argv[++i];
        } else if (a=="--changed-since" && has_value) {
            cli.changed_since = argv[++i];
        } else if (a=="--committed-only") {
            cli.committed_only = true;
        } else if (a=="--tracked-only") {
            cli.tracked_only = true;
        } else if (a=="--content-detection") {
            cli.content_detection = true;
        } else if (a=="--include-ext" && has_value) {
            for (auto& e : split_list(argv[++i], ';')) cli.include_exts.push_back(e);
        } else if (a=="--exclude-ext" && has_value) {
            for (auto& e : split_list(argv[++i], ';')) cli.exclude_exts.push_back(e);
        } else if (a=="--config" && has_value) {
            cli.config_file = std::filesystem::path(argv[++i]);
        } else if (a=="--diff") {
            cli.show_diff = true;
        } else if (a=="--list-files") {
            cli.list_files = true;
        } else if (a=="--log-file" && has_value) {
            cli.log_file = std::filesystem::path(argv[++i]);
        } else if (a=="--log-rotate-max" && has_value) {
            cli.log_rotate_max = static_cast<size_t>(parse_number(a, argv[++i]));
        } else if (a=="--log-rotate-files" && has_value) {
            cli.log_rotate_files = static_cast<size_t>(parse_number(a, argv[++i]));
        } else if (a=="--verbose" || a=="-v") {
            cli.verbose = true;
        } else if (a=="--quiet" || a=="-q") {
            cli.quiet = true;
        } else if (a=="--help" || a=="-h") {
            print_usage(argv[0]);
            std::exit(kExitOk);
        } else if (a=="--") {
            for (++i; i<argc; ++i) cli.patterns.push_back(argv[i]);
        } else if (!a.empty() && a[0]=='-') {
            spdlog::error("Unknown argument: {}", a);
            print_usage(argv[0]);
            return std::nullopt;
        } else {
            cli.patterns.push_back(a);
        }
    }
    if (cli.patterns.empty()) {
        spdlog::error("at least one PATTERN is required");
        print_usage(argv[0]);
        return std::nullopt;
    }
    return cli;
}

static void setup_logging(const Cli& cli){
    auto level = cli.verbose ? spdlog::level::debug : cli.quiet ? spdlog::level::warn : spdlog::level::info;
    if (cli.log_file) {
        try {
            std::vector<spdlog::sink_ptr> sinks{
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    cli.log_file->string(), cli.log_rotate_max, cli.log_rotate_files),
            };
            auto logger = std::make_shared<spdlog::logger>("hdrguard", sinks.begin(), sinks.end());
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("failed to initialize rotating log sink ({}), fallback to default stderr", e.what());
        }
    } else {
        spdlog::set_default_logger(spdlog::stderr_color_mt("hdrguard"));
    }
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(level);
}

static RunConfig build_config(const Cli& cli, const Workspace& ws){
    RunConfig cfg;
    if (auto file = locate_config_file(ws.root, cli.config_file)) {
        load_config_file(*file, cfg);
    }
    if (cli.global_ignore_file) cfg.global_ignore_file = cli.global_ignore_file;
    apply_environment(cfg);

    cfg.mode = cli.modify ? Mode::Modify : Mode::Check;
    cfg.year = cli.year;
    cfg.preserve_years = cli.preserve_years;
    if (cli.prefix_window) cfg.prefix_window = *cli.prefix_window;
    if (cli.jobs) cfg.jobs = *cli.jobs;
    cfg.template_file = cli.license_file;
    cfg.ignore_patterns = cli.ignores;
    if (cli.ignore_file_name) cfg.ignore_file_name = *cli.ignore_file_name;
    cfg.changed_since = cli.changed_since;
    cfg.committed_only = cli.committed_only;
    cfg.tracked_only = cli.tracked_only;
    if (cli.content_detection) cfg.detector = DetectorKind::Content;
    cfg.collect_diffs = cli.show_diff;
    if (!cli.include_exts.empty()) {
        cfg.include_extensions = cli.include_exts;
        cfg.exclude_extensions.clear();
    }
    if (!cli.exclude_exts.empty()) {
        cfg.exclude_extensions = cli.exclude_exts;
        if (cli.include_exts.empty()) cfg.include_extensions.clear();
    }
    return cfg;
}

static std::string display(const std::filesystem::path& p, const std::filesystem::path& cwd){
    if (auto rel = relative_to(p, cwd); rel && !rel->empty()) return *rel;
    return p.string();
}

static void print_outcome(const FileOutcome& o, const Cli& cli, const std::filesystem::path& cwd){
    auto name = display(o.path, cwd);
    switch (o.kind) {
    case OutcomeKind::HeaderMissing:
        fmt::print("missing header: {}\n", name);
        break;
    case OutcomeKind::Failed:
        fmt::print("failed: {}: {}\n", name, o.reason);
        break;
    case OutcomeKind::HeaderAdded:
    case OutcomeKind::YearUpdated:
        if (o.written || cli.list_files) fmt::print("{}: {}\n", to_string(o.kind), name);
        else fmt::print("outdated year: {}\n", name);
        break;
    case OutcomeKind::AlreadyCompliant:
    case OutcomeKind::Skipped:
        if (cli.list_files) {
            if (o.reason.empty()) fmt::print("{}: {}\n", to_string(o.kind), name);
            else fmt::print("{}: {} ({})\n", to_string(o.kind), name, o.reason);
        }
        break;
    }
    if (cli.show_diff && o.diff && o.diff->before != o.diff->after) {
        fmt::print("--- {}\n+++ {}\n", name, name);
        // prefix spans only; the rest of the file is unchanged
        auto emit = [](const std::string& text, char mark) {
            size_t start = 0;
            while (start < text.size()) {
                auto end = text.find('\n', start);
                if (end == std::string::npos) end = text.size();
                fmt::print("{}{}\n", mark, std::string_view(text).substr(start, end - start));
                start = end + 1;
            }
        };
        emit(o.diff->before, '-');
        emit(o.diff->after, '+');
    }
}

static void print_summary(const RunSummary& s, Mode mode, std::chrono::steady_clock::duration elapsed){
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    fmt::print("{} files in {} ms: {} compliant, {} added, {} updated, {} missing, {} skipped, {} failed ({} mode)\n",
               s.total(), ms, s.compliant, s.added, s.updated, s.missing, s.skipped, s.failed,
               mode == Mode::Check ? "check" : "modify");
}

int main(int argc, char** argv) {
    std::optional<Cli> cli;
    try {
        cli = parse_cli(argc, argv);
    } catch (const ConfigurationError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }
    if (!cli) return kExitUsage;

    setup_logging(*cli);

    auto cwd = std::filesystem::current_path();
    auto started = std::chrono::steady_clock::now();
    try {
        auto ws = resolve_workspace(cli->patterns, cwd);
        auto cfg = build_config(*cli, ws);
        spdlog::debug("hdrguard starting; root={} mode={} year={}", ws.root.string(),
                      cfg.mode == Mode::Check ? "check" : "modify",
                      cfg.preserve_years ? std::string("preserve") : std::to_string(cfg.target_year()));

        Runner runner(std::move(cfg), std::move(ws));
        Aggregator agg([&](const FileOutcome& o){ print_outcome(o, *cli, cwd); }, false);
        auto summary = runner.run(cli->patterns, cwd, agg);

        auto mode = runner.config().mode;
        print_summary(summary, mode, std::chrono::steady_clock::now() - started);
        return summary.failing(mode) ? kExitSignal : kExitOk;
    } catch (const ConfigurationError& e) {
        spdlog::error("configuration error: {}", e.what());
        return kExitUsage;
    } catch (const VcsError& e) {
        spdlog::error("git error: {}", e.what());
        return kExitUsage;
    }
}
