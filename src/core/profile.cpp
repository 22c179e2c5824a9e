/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "pong/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration elapsed) {
    auto& stats = getInstance().sections[name];
    if (stats.name.empty()) {
        stats.name = name;
    }
    stats.total_time += elapsed;
    stats.call_count += 1;
    stats.min_time = std::min(stats.min_time, elapsed);
    stats.max_time = std::max(stats.max_time, elapsed);
}

std::vector<Profiler::SectionStats> Profiler::snapshot() {
    std::vector<SectionStats> result;
    const auto& sections = getInstance().sections;
    result.reserve(sections.size());
    for (const auto& [name, stats] : sections) {
        result.push_back(stats);
    }
    std::sort(result.begin(), result.end(),
              [](const SectionStats& a, const SectionStats& b) {
                  return a.total_time > b.total_time;
              });
    return result;
}

void Profiler::printStats() {
    auto toMicros = [](Duration d) {
        return std::chrono::duration<double, std::micro>(d).count();
    };

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& stats : snapshot()) {
        double const mean = stats.call_count > 0
            ? toMicros(stats.total_time) / static_cast<double>(stats.call_count)
            : 0.0;
        std::cout << "  " << std::left << std::setw(32) << stats.name
                  << std::right << std::setw(8) << stats.call_count << " calls  "
                  << std::fixed << std::setprecision(1)
                  << "mean " << mean << "us  "
                  << "min " << toMicros(stats.min_time) << "us  "
                  << "max " << toMicros(stats.max_time) << "us\n";
    }
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name,
        std::chrono::duration_cast<Profiler::Duration>(Profiler::Clock::now() - start_time));
}

} // namespace Profiling
