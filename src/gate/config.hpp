#pragma once

#include <string>

struct Config {
    struct Backend {
        std::string library_dir;                  // empty: default dlopen search path
        std::string abi;                          // empty: derived from uname
        std::string cpuinfo_path = "/proc/cpuinfo";
    } backend;

    struct Transcription {
        std::string language = "en";
        int threads = 0;                          // 0: derived from CPU topology
        bool emit_timestamps = true;
    } transcription;

    struct Assets {
        std::string root;
    } assets;

    struct Log {
        bool verbose = false;
    } log;

    static Config load(const std::string& path);
    static Config load_default();
};
