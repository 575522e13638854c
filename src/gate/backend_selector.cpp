#include "backend_selector.hpp"

#include "log.hpp"
#include "native/dynamic_engine.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <print>
#include <sstream>

namespace fs = std::filesystem;

const char* variant_name(BackendVariant variant) {
    switch (variant) {
        case BackendVariant::Baseline: return "baseline";
        case BackendVariant::ArmVfpv4: return "arm-vfpv4";
        case BackendVariant::ArmV8Fp16: return "armv8-fp16";
    }
    return "unknown";
}

const char* variant_library(BackendVariant variant) {
    switch (variant) {
        case BackendVariant::Baseline: return "libspeechgate_engine.so";
        case BackendVariant::ArmVfpv4: return "libspeechgate_engine_vfpv4.so";
        case BackendVariant::ArmV8Fp16: return "libspeechgate_engine_v8fp16_va.so";
    }
    return "libspeechgate_engine.so";
}

std::string abi_from_machine(const std::string& machine) {
    if (machine == "aarch64" || machine == "arm64" || machine == "armv8b") return "arm64-v8a";
    // 32-bit userland on ARMv8 reports armv8l.
    if (machine.starts_with("armv7") || machine == "armv8l") return "armeabi-v7a";
    if (machine == "x86_64" || machine == "amd64") return "x86_64";
    if (machine.size() == 4 && machine[0] == 'i' && machine.ends_with("86")) return "x86";
    return machine;
}

std::optional<std::string> read_cpuinfo(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "backend: couldn't read {}", path);
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        std::println(stderr, "backend: error reading {}", path);
        return std::nullopt;
    }
    return ss.str();
}

BackendSelector::BackendSelector(std::string primary_abi, CpuInfoReader read_cpuinfo)
    : primary_abi_(std::move(primary_abi)), read_cpuinfo_(std::move(read_cpuinfo)) {}

BackendSelector BackendSelector::from_config(const Config::Backend& cfg) {
    std::string abi = cfg.abi.empty() ? abi_from_machine(platform::machine_arch()) : cfg.abi;
    return BackendSelector(std::move(abi), [path = cfg.cpuinfo_path] {
        return read_cpuinfo(path);
    });
}

BackendVariant BackendSelector::select() const {
    logging::debug("primary ABI: {}", primary_abi_);

    if (primary_abi_ == "armeabi-v7a") {
        // armeabi-v7a needs runtime detection of vfpv4
        auto info = read_cpuinfo_();
        if (info && info->find("vfpv4") != std::string::npos) {
            logging::debug("CPU supports vfpv4");
            return BackendVariant::ArmVfpv4;
        }
    } else if (primary_abi_ == "arm64-v8a") {
        // ARMv8.2-a fp16 arithmetic needs runtime detection too
        auto info = read_cpuinfo_();
        if (info && info->find("fphp") != std::string::npos) {
            logging::debug("CPU supports fp16 arithmetic");
            return BackendVariant::ArmV8Fp16;
        }
    }
    return BackendVariant::Baseline;
}

BackendLoader::BackendLoader(BackendSelector selector, std::string library_dir,
                             EngineOpener opener)
    : selector_(std::move(selector)), library_dir_(std::move(library_dir)),
      opener_(std::move(opener)) {}

GateResult<NativeEngine*> BackendLoader::ensure_loaded() {
    std::lock_guard lock(mutex_);
    if (engine_) return engine_.get();
    if (error_) return std::unexpected(*error_);

    auto variant = selector_.select();
    variant_ = variant;

    auto path = library_path(variant);
    logging::debug("loading {} ({})", path, variant_name(variant));

    auto engine = opener_(path);
    if (!engine || !*engine) {
        GateError err = engine ? GateError{
                                     .kind = ErrorKind::BackendLoad,
                                     .message = "no engine returned for " + path,
                                     .source = path,
                                 }
                               : engine.error();
        std::println(stderr, "backend: {}", err.message);
        error_ = err;
        return std::unexpected(std::move(err));
    }

    engine_ = std::move(*engine);
    return engine_.get();
}

std::optional<BackendVariant> BackendLoader::variant() const {
    std::lock_guard lock(mutex_);
    return variant_;
}

std::string BackendLoader::library_path(BackendVariant variant) const {
    if (library_dir_.empty()) return variant_library(variant);
    return (fs::path(library_dir_) / variant_library(variant)).string();
}

GateResult<NativeEngine*> ensure_backend_loaded(const Config::Backend& cfg) {
    static BackendLoader loader(
        BackendSelector::from_config(cfg), cfg.library_dir,
        [](const std::string& path) -> GateResult<std::unique_ptr<NativeEngine>> {
            auto engine = DynamicEngine::open(path);
            if (!engine) return std::unexpected(engine.error());
            return std::unique_ptr<NativeEngine>(std::move(*engine));
        });
    return loader.ensure_loaded();
}
