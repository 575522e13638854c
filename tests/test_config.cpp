#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "sg_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.library_dir.empty());
        REQUIRE(cfg.backend.abi.empty());
        REQUIRE(cfg.backend.cpuinfo_path == "/proc/cpuinfo");
        REQUIRE(cfg.transcription.language == "en");
        REQUIRE(cfg.transcription.threads == 0);
        REQUIRE(cfg.transcription.emit_timestamps);
        REQUIRE(cfg.assets.root.empty());
        REQUIRE_FALSE(cfg.log.verbose);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "library_dir": "/opt/speechgate/lib",
                "abi": "arm64-v8a",
                "cpuinfo_path": "/tmp/cpuinfo"
            },
            "transcription": { "language": "de", "threads": 6, "emit_timestamps": false },
            "assets": { "root": "/opt/speechgate/assets" },
            "log": { "verbose": true }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.library_dir == "/opt/speechgate/lib");
        REQUIRE(cfg.backend.abi == "arm64-v8a");
        REQUIRE(cfg.backend.cpuinfo_path == "/tmp/cpuinfo");
        REQUIRE(cfg.transcription.language == "de");
        REQUIRE(cfg.transcription.threads == 6);
        REQUIRE_FALSE(cfg.transcription.emit_timestamps);
        REQUIRE(cfg.assets.root == "/opt/speechgate/assets");
        REQUIRE(cfg.log.verbose);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transcription": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.transcription.threads == 0);
        REQUIRE(cfg.backend.cpuinfo_path == "/proc/cpuinfo");
        REQUIRE_FALSE(cfg.log.verbose);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "en");
        REQUIRE(cfg.backend.cpuinfo_path == "/proc/cpuinfo");
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "transcription": { "language": "it", "threads": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "en");
        REQUIRE(cfg.transcription.threads == 0);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/sg_test_nonexistent_config_file.json");
        REQUIRE(cfg.transcription.language == "en");
        REQUIRE(cfg.backend.abi.empty());
    }
}
