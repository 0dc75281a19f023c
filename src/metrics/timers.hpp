#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace dsprof {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
};

struct RunStage {
    std::string name;
    std::uint64_t calls = 0;
    double total_ms = 0.0;
};

// Accumulates wall time per named stage, in first-use order.
class StageTimings {
public:
    void record(const std::string& name, double ms) {
        for (auto& s : stages_) {
            if (s.name == name) { ++s.calls; s.total_ms += ms; return; }
        }
        stages_.push_back(RunStage{name, 1, ms});
    }
    const std::vector<RunStage>& stages() const { return stages_; }

private:
    std::vector<RunStage> stages_;
};

// Times one scope into a StageTimings.
class ScopedStage {
public:
    ScopedStage(StageTimings& sink, std::string name) : sink_(sink), name_(std::move(name)) { wt_.start(); }
    ~ScopedStage() {
        wt_.stop();
        sink_.record(name_, wt_.ms());
    }
    ScopedStage(const ScopedStage&) = delete;
    ScopedStage& operator=(const ScopedStage&) = delete;

private:
    StageTimings& sink_;
    std::string name_;
    WallTimer wt_;
};

}
