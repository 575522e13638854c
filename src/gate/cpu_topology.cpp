#include "cpu_topology.hpp"

#include "log.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <map>

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<int> parse_int(const std::string& s, int base = 10) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::string binned(const std::vector<int>& values) {
    std::map<int, int> bins;
    for (int v : values) bins[v]++;
    std::string out;
    for (auto [value, count] : bins) {
        if (!out.empty()) out += ", ";
        out += std::format("{}={}", value, count);
    }
    return out;
}

} // namespace

CpuTopology::CpuTopology(std::vector<std::string> cpuinfo_lines, FrequencyReader max_frequency)
    : lines_(std::move(cpuinfo_lines)), max_frequency_(std::move(max_frequency)) {}

CpuTopology CpuTopology::from_system(const std::string& cpuinfo_path) {
    std::vector<std::string> lines;
    std::ifstream f(cpuinfo_path);
    if (f.is_open()) {
        std::string line;
        while (std::getline(f, line)) {
            lines.push_back(std::move(line));
        }
    } else {
        logging::debug("couldn't read {}", cpuinfo_path);
    }

    return CpuTopology(std::move(lines), [](int cpu) -> std::optional<int> {
        std::ifstream freq(std::format("/sys/devices/system/cpu/cpu{}/cpufreq/cpuinfo_max_freq", cpu));
        if (!freq.is_open()) return std::nullopt;
        std::string value;
        std::getline(freq, value);
        return parse_int(trim(value));
    });
}

int CpuTopology::high_perf_cpu_count() const {
    if (auto count = count_by_frequencies()) return *count;
    logging::debug("couldn't read CPU frequencies, falling back to CPU variant");
    if (auto count = count_by_variant()) return *count;
    return 0;
}

int CpuTopology::preferred_thread_count() const {
    return std::max(high_perf_cpu_count(), 2);
}

std::optional<int> CpuTopology::count_by_frequencies() const {
    std::vector<int> freqs;
    for (const auto& value : values_of("processor")) {
        auto cpu = parse_int(value);
        if (!cpu) return std::nullopt;
        auto freq = max_frequency_(*cpu);
        if (!freq) return std::nullopt;
        freqs.push_back(*freq);
    }
    if (freqs.empty()) return std::nullopt;

    logging::debug("binned cpu frequencies (frequency=count): {}", binned(freqs));

    int min = *std::min_element(freqs.begin(), freqs.end());
    return static_cast<int>(std::count_if(freqs.begin(), freqs.end(),
                                          [min](int f) { return f > min; }));
}

std::optional<int> CpuTopology::count_by_variant() const {
    std::vector<int> variants;
    for (const auto& value : values_of("CPU variant")) {
        auto pos = value.find("0x");
        auto variant = parse_int(pos == std::string::npos ? value : value.substr(pos + 2), 16);
        if (!variant) return std::nullopt;
        variants.push_back(*variant);
    }
    if (variants.empty()) return std::nullopt;

    logging::debug("binned cpu variants (variant=count): {}", binned(variants));

    int min = *std::min_element(variants.begin(), variants.end());
    return static_cast<int>(std::count(variants.begin(), variants.end(), min));
}

std::vector<std::string> CpuTopology::values_of(const std::string& property) const {
    std::vector<std::string> values;
    for (const auto& line : lines_) {
        if (!line.starts_with(property)) continue;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        values.push_back(trim(line.substr(colon + 1)));
    }
    return values;
}
