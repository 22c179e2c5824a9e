/**
 * @file profile.hpp
 * @brief Per-frame timing of named code sections
 *
 * Every system run and every simulation tick is wrapped in a PROFILE_SCOPE.
 * The profiler aggregates call counts and durations per section name and
 * prints a table sorted by total time.
 *
 * @code
 * void tick() {
 *     PROFILE_SCOPE("PongSimulator::tick");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide aggregate of section timings (singleton).
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    struct SectionStats {
        std::string name;
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        uint64_t call_count{0};
    };

    /**
     * @brief Adds one measured run of a section.
     */
    static void record(const std::string& name, Duration elapsed);

    /**
     * @brief Snapshot of all sections, largest total time first.
     */
    static std::vector<SectionStats> snapshot();

    /**
     * @brief Print the snapshot as a table to stdout.
     */
    static void printStats();

    static void reset();

private:
    std::unordered_map<std::string, SectionStats> sections;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard timing the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define PONG_PROFILE_CONCAT_INNER(a, b) a##b
#define PONG_PROFILE_CONCAT(a, b) PONG_PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PONG_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
