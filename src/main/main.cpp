#include <fmt/format.h>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <string>

#include "../cli/cli_options.hpp"
#include "../core/errors.hpp"
#include "../io/file_stats.hpp"
#include "../pipeline/orchestrator.hpp"
#include "../report/emit_run_json.hpp"
#include "../report/file_sink.hpp"
#include "../report/render_context.hpp"
#include "../util/log.hpp"

namespace fs = std::filesystem;

// ---------- small helpers ----------
static std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

static std::string gen_project_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "dsprof-%Y%m%d-%H%M%S", &tm);
    return std::string(buf);
}

static dsprof::CancellationToken g_cancel;

extern "C" void on_interrupt(int) { g_cancel.cancel(); }

// Explicit --template must exist; otherwise templates/context.mustache is optional.
static std::string load_context_template(const std::string& requested) {
    if (!requested.empty()) {
        const fs::path found = dsprof::find_template(requested);
        if (found.empty()) throw dsprof::Error("template not found: " + requested);
        return dsprof::read_template(found);
    }
    const fs::path found = dsprof::find_template("context.mustache");
    if (found.empty()) return dsprof::default_context_template();
    dsprof::log_debug("using context template {}", found.string());
    return dsprof::read_template(found);
}

int main(int argc, char** argv) try {
    CLI::App app{"dsprof: dataset profiler and schema synthesizer"};
    dsprof::AppOptions opt;
    dsprof::configure_cli(app, opt);
    try {
        app.parse(argc, argv);
        dsprof::finalize_options(opt);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? 0 : 1;
    }
    if (opt.project_id.empty())
        opt.project_id = gen_project_id();

    const fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        dsprof::log_error("input not found: {}", input_path.string());
        return 2; // IO error
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    dsprof::log_info("profiling {} (categorical={}, outliers={}, workers={})", input_path.string(),
                     dsprof::to_string(opt.profiler.category_policy), dsprof::to_string(opt.profiler.outliers),
                     dsprof::resolve_workers(opt.profiler.workers));

    const std::string context_template = load_context_template(opt.context_template);
    const std::string bytes = dsprof::read_file_bytes(input_path);
    const auto started_iso = now_iso_utc();

    dsprof::Profiler profiler(opt.profiler, [](std::string_view stage, int percent, std::string_view message) {
        dsprof::log_info("[{:>3}%] {}: {}", percent, stage, message);
    });

    try {
        dsprof::ProfilingRun run = profiler.profile(bytes, input_path.filename().string(), &g_cancel);

        const fs::path out_dir = dsprof::ensure_artifacts_dir(opt.output_root, opt.project_id);
        dsprof::FileSink sink(out_dir, context_template);
        profiler.hand_off(run, sink, &g_cancel);

        dsprof::emit_run_json((out_dir / "run.json").string(), run.report, started_iso, now_iso_utc(),
                              dsprof::to_string(profiler.state()));
        for (const auto& w : run.profile.warnings)
            dsprof::log_warn("{}: {}", w.column, w.message);
        for (const auto& e : run.profile.quality.errors)
            dsprof::log_warn("column {} not analyzed: {}", e.column, e.message);

        fmt::print("OK {}\n", out_dir.string());
        return 0;
    } catch (const dsprof::LoadError& e) {
        dsprof::log_error("{}", dsprof::describe(e));
        return 2;
    } catch (const dsprof::SchemaError& e) {
        dsprof::log_error("{}", dsprof::describe(e));
        return 3;
    } catch (const dsprof::ProfilingError& e) {
        dsprof::log_error("{}", dsprof::describe(e));
        return 3;
    }
}
catch (const std::exception& e) {
    dsprof::log_error("{}", dsprof::describe(e));
    return 4; // internal error
}
