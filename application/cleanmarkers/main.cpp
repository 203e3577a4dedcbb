#include <cleanmarkers/age.hpp>
#include <cleanmarkers/cli.hpp>
#include <cleanmarkers/walker.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>

#ifndef CLEANMARKERS_VERSION
#define CLEANMARKERS_VERSION "0.0.0"
#endif

using namespace cleanmarkers;

static std::atomic<bool> g_stop{false};

static void on_signal(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_stop.store(true);
    }
}

static void setup_logging(const Options& opts){
    if (opts.log_file) {
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.log_file->string(), opts.log_rotate_max, opts.log_rotate_files);
            auto logger = std::make_shared<spdlog::logger>("cleanmarkers", sink);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("failed to initialize rotating log sink ({}), fallback to default stderr", e.what());
        }
    }
    if (opts.verbosity >= 2) spdlog::set_level(spdlog::level::trace);
    else if (opts.verbosity == 1) spdlog::set_level(spdlog::level::debug);
    else spdlog::set_level(spdlog::level::info);
}

int main(int argc, char** argv) {
    auto pr = parse_cli(argc, argv);
    if (!pr.opts) {
        spdlog::error("{}", pr.error);
        print_usage(argv[0]);
        return 2;
    }
    const Options& opts = *pr.opts;
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts.version) {
        fmt::print("cleanmarkers {}\n", CLEANMARKERS_VERSION);
        return 0;
    }

    setup_logging(opts);

    const Config& cfg = opts.config;
    spdlog::debug("ext={} exclude={} age={} dry_run={} follow_symlinks={} fail_fast={} jobs={}",
                  fmt::join(cfg.extensions, ","), fmt::join(cfg.excludes, ","),
                  cfg.max_age ? format_age(*cfg.max_age) : std::string("none"),
                  cfg.dry_run, cfg.follow_symlinks, cfg.fail_fast, cfg.jobs);

    for (const auto& root : opts.roots) {
        std::string err;
        if (!Walker::validate_root(root, err)) {
            spdlog::error("invalid root {}: {}", root.string(), err);
            return 1;
        }
    }

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    Walker walker(cfg);
    auto st = walker.run(opts.roots, g_stop);

    spdlog::info("{}scanned {} file(s), {} {} ({} span(s)), {} skipped on error",
                 cfg.dry_run ? "dry run: " : "",
                 st.scanned, st.changed,
                 cfg.dry_run ? "would change" : "changed",
                 st.spans, st.errors);

    if (st.interrupted) {
        spdlog::warn("interrupted");
        return 130;
    }
    if (st.aborted) {
        spdlog::error("stopped after first error (--fail-fast)");
        return 1;
    }
    return 0;
}
