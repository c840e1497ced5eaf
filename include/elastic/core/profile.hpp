/**
 * @file profile.hpp
 * @brief Scoped timing of code sections, aggregated into a call tree
 *
 * Sections nest: a section started while another is open becomes its child.
 * For each section the profiler keeps total time, self time (total minus
 * children), call count and min/max duration.
 *
 * Example usage:
 * @code
 * void step() {
 *     PROFILE_SCOPE("Integrator::step");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cerr);
 * @endcode
 *
 * Not thread-safe; the simulation runs on a single thread.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named scope
     */
    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};         ///< total_time minus time spent in children
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Opens a named section; must be closed with endSection.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost open section.
     *
     * A name that does not match the innermost section is reported on
     * stderr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Prints the call tree with total/self percentages.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Statistics recorded for @p name, if that section ever ran
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Drops all recorded sections.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a section on construction, ends it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under @p name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
