#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Picks the native thread count from the CPU layout: the number of
// high-performance ("big") cores, never less than 2.
class CpuTopology {
public:
    // Max frequency of a CPU index, nullopt if unreadable.
    using FrequencyReader = std::function<std::optional<int>(int cpu_index)>;

    CpuTopology(std::vector<std::string> cpuinfo_lines, FrequencyReader max_frequency);

    // Reads cpuinfo_path and /sys/devices/system/cpu/cpuN/cpufreq/cpuinfo_max_freq.
    static CpuTopology from_system(const std::string& cpuinfo_path = "/proc/cpuinfo");

    int high_perf_cpu_count() const;
    int preferred_thread_count() const;

private:
    std::optional<int> count_by_frequencies() const;
    std::optional<int> count_by_variant() const;
    std::vector<std::string> values_of(const std::string& property) const;

    std::vector<std::string> lines_;
    FrequencyReader max_frequency_;
};
