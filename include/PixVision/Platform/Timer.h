#pragma once

/**
 * @file Timer.h
 * @brief Wall-clock timing for searches and benchmarks
 *
 * @code
 * {
 *     ScopedTimer timer("FindTemplate");
 *     FindTemplate(screen, button);
 * }  // prints "FindTemplate: 12.345 ms"
 * @endcode
 */

#include <PixVision/Core/Export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace Pix::Vision::Platform {

/**
 * @brief Stopwatch on std::chrono::steady_clock
 *
 * Time accumulates over Start()/Stop() pairs.
 */
class PIXVISION_API Timer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Timer(bool autoStart = false);

    void Start();
    void Stop();

    /// Accumulated time, including the running interval
    double ElapsedMs() const;

private:
    Clock::time_point started_;
    Clock::duration total_{0};
    bool running_ = false;
};

/**
 * @brief Prints "<name>: <ms> ms" to stdout when it goes out of scope
 */
class PIXVISION_API ScopedTimer {
public:
    explicit ScopedTimer(std::string name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

private:
    std::string name_;
    Timer timer_;
};

// ============================================================================
// Benchmarking
// ============================================================================

struct PIXVISION_API BenchmarkResult {
    double minMs = 0.0;
    double maxMs = 0.0;
    double avgMs = 0.0;
    double medianMs = 0.0;
    size_t iterations = 0;
};

/**
 * @brief Time each call of func separately
 *
 * @param func       Work to measure
 * @param iterations Timed calls
 * @param warmup     Untimed calls made first
 */
PIXVISION_API BenchmarkResult BenchmarkDetailed(const std::function<void()>& func,
                                                size_t iterations = 100,
                                                size_t warmup = 10);

PIXVISION_API void PrintBenchmarkResult(const std::string& name, const BenchmarkResult& result);

} // namespace Pix::Vision::Platform
