#include <PixVision/Platform/Timer.h>

#include <algorithm>
#include <cstdio>
#include <numeric>
#include <utility>
#include <vector>

namespace Pix::Vision::Platform {

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (running_) {
        return;
    }
    started_ = Clock::now();
    running_ = true;
}

void Timer::Stop() {
    if (!running_) {
        return;
    }
    total_ += Clock::now() - started_;
    running_ = false;
}

double Timer::ElapsedMs() const {
    Clock::duration total = total_;
    if (running_) {
        total += Clock::now() - started_;
    }
    return std::chrono::duration<double, std::milli>(total).count();
}

ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name))
    , timer_(true) {
}

ScopedTimer::~ScopedTimer() {
    std::printf("%s: %.3f ms\n", name_.c_str(), timer_.ElapsedMs());
}

BenchmarkResult BenchmarkDetailed(const std::function<void()>& func,
                                  size_t iterations,
                                  size_t warmup) {
    for (size_t i = 0; i < warmup; ++i) {
        func();
    }

    BenchmarkResult result;
    result.iterations = iterations;
    if (iterations == 0) {
        return result;
    }

    std::vector<double> samples;
    samples.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        Timer timer(true);
        func();
        samples.push_back(timer.ElapsedMs());
    }

    std::sort(samples.begin(), samples.end());
    const size_t mid = iterations / 2;
    result.minMs = samples.front();
    result.maxMs = samples.back();
    result.avgMs = std::accumulate(samples.begin(), samples.end(), 0.0) /
                   static_cast<double>(iterations);
    result.medianMs = (iterations % 2 != 0) ? samples[mid]
                                            : 0.5 * (samples[mid - 1] + samples[mid]);
    return result;
}

void PrintBenchmarkResult(const std::string& name, const BenchmarkResult& result) {
    std::printf("%s (%zu runs)\n", name.c_str(), result.iterations);
    std::printf("  min %.3f ms | median %.3f ms | avg %.3f ms | max %.3f ms\n",
                result.minMs, result.medianMs, result.avgMs, result.maxMs);
}

} // namespace Pix::Vision::Platform
