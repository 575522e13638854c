#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "native/native_engine.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

enum class BackendVariant { Baseline, ArmVfpv4, ArmV8Fp16 };

const char* variant_name(BackendVariant variant);
// Shared library file name of the engine build for a variant.
const char* variant_library(BackendVariant variant);

// Maps a uname machine string to an Android-style ABI name
// ("armeabi-v7a", "arm64-v8a", "x86_64", "x86"). Unknown machines pass through.
std::string abi_from_machine(const std::string& machine);

// Contents of the CPU description file, nullopt (logged) if unreadable.
std::optional<std::string> read_cpuinfo(const std::string& path);

// Chooses the engine variant from the primary ABI and, for ARM ABIs only,
// the capability flags in the CPU description.
class BackendSelector {
public:
    using CpuInfoReader = std::function<std::optional<std::string>()>;

    BackendSelector(std::string primary_abi, CpuInfoReader read_cpuinfo);

    static BackendSelector from_config(const Config::Backend& cfg);

    BackendVariant select() const;

    const std::string& primary_abi() const { return primary_abi_; }

private:
    std::string primary_abi_;
    CpuInfoReader read_cpuinfo_;
};

// Selects and opens the engine library once. Later calls return the first
// outcome, including a failure; no other variant is ever tried.
class BackendLoader {
public:
    using EngineOpener =
        std::function<GateResult<std::unique_ptr<NativeEngine>>(const std::string& library_path)>;

    BackendLoader(BackendSelector selector, std::string library_dir, EngineOpener opener);

    GateResult<NativeEngine*> ensure_loaded();

    // Set once ensure_loaded() has run.
    std::optional<BackendVariant> variant() const;

private:
    std::string library_path(BackendVariant variant) const;

    BackendSelector selector_;
    std::string library_dir_;
    EngineOpener opener_;

    mutable std::mutex mutex_;
    std::optional<BackendVariant> variant_;
    std::unique_ptr<NativeEngine> engine_;
    std::optional<GateError> error_;
};

// Process-wide loader. Call once during startup, before creating sessions;
// a BackendLoad error is fatal to the host. The configuration of the first
// call wins.
GateResult<NativeEngine*> ensure_backend_loaded(const Config::Backend& cfg);
