#include "metrics/timers.hpp"
#include "io/file_stats.hpp"
#include "pipeline/orchestrator.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <filesystem>

using std::string;
using dsprof::WallTimer;
using dsprof::file_size_bytes;
using dsprof::read_file_bytes;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Defaults
  string dataPath;
  int workers = 0;
  double partitionMb = 500.0;

  // Supported:
  //   --data <file>            | --data=<file>
  //   --workers <N>            | --workers=<N>
  //   --partition-mb <MB>      | --partition-mb=<MB>   (lower it to force the partitioned loader)
  // Fallback positional: <input.csv> [workers]
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);

    auto eat_next = [&](std::string_view name, string* out)->bool{
      if (i+1<argc){ *out = argv[++i]; return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };

    string v;
    if (a.rfind("--data=",0)==0) {
      dataPath = string(a.substr(7));
    } else if (a == "--data") {
      if (!eat_next("--data", &dataPath)) return 2;
    } else if (a.rfind("--workers=",0)==0) {
      workers = std::stoi(string(a.substr(10)));
    } else if (a == "--workers") {
      if (!eat_next("--workers", &v)) return 2;
      workers = std::stoi(v);
    } else if (a.rfind("--partition-mb=",0)==0) {
      partitionMb = std::stod(string(a.substr(15)));
    } else if (a == "--partition-mb") {
      if (!eat_next("--partition-mb", &v)) return 2;
      partitionMb = std::stod(v);
    } else if (!dataPath.size() && a.size() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') {
        ++i;
        workers = std::stoi(argv[i]);
      }
    } else {
      // ignore unknown flags so you can pass extra args without breaking
    }
  }

  if (dataPath.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  dsprof_bench_pipeline <input.csv> [workers]\n"
      "  dsprof_bench_pipeline --data <input.csv> [--workers N] [--partition-mb MB]\n");
    return 2;
  }

  const auto bytes = file_size_bytes(dataPath);
  if (bytes == 0){
    fmt::print(stderr, "file empty or missing: {}\n", dataPath);
    return 2;
  }

  dsprof::ProfilerConfig cfg;
  cfg.workers = workers;
  cfg.partition_threshold_bytes = static_cast<std::uint64_t>(partitionMb * 1024.0 * 1024.0);

  try {
    const string content = read_file_bytes(dataPath);
    dsprof::Profiler profiler(cfg);

    WallTimer wt; wt.start();
    const auto run = profiler.profile(content, fs::path(dataPath).filename().string());
    wt.stop();

    const double secs = wt.ms()/1000.0;
    const double mb   = double(bytes)/(1024.0*1024.0);
    const double mbps = secs>0? (mb/secs) : 0.0;
    const double rps  = secs>0? (double(run.report.rows)/secs) : 0.0;

    fmt::print("bench_pipeline,file={},rows={},cols={},bytes={},workers={},partitioned={},sec={:.3f},MB/s={:.2f},rows/s={:.0f},rss_peak_mb={:.1f}\n",
               dataPath, run.report.rows, run.report.columns, bytes, run.report.workers,
               run.report.partitioned ? 1 : 0, secs, mbps, rps, run.report.rss_peak_mb);
    for (const auto& s : run.report.stages)
      fmt::print("  stage,{},calls={},ms={:.2f}\n", s.name, s.calls, s.total_ms);
  } catch (const std::exception& e) {
    fmt::print(stderr, "bench failed: {}\n", dsprof::describe(e));
    return 1;
  }
  return 0;
}
