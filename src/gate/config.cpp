#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("library_dir")) cfg.backend.library_dir = b["library_dir"].get<std::string>();
            if (b.contains("abi")) cfg.backend.abi = b["abi"].get<std::string>();
            if (b.contains("cpuinfo_path")) cfg.backend.cpuinfo_path = b["cpuinfo_path"].get<std::string>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("threads")) cfg.transcription.threads = t["threads"].get<int>();
            if (t.contains("emit_timestamps")) cfg.transcription.emit_timestamps = t["emit_timestamps"].get<bool>();
        }

        if (j.contains("assets")) {
            auto& a = j["assets"];
            if (a.contains("root")) cfg.assets.root = a["root"].get<std::string>();
        }

        if (j.contains("log")) {
            auto& l = j["log"];
            if (l.contains("verbose")) cfg.log.verbose = l["verbose"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
