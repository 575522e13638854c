#pragma once

#include "../errors.hpp"
#include "engine_abi.h"
#include "native_engine.hpp"

#include <memory>
#include <string>

// NativeEngine backed by a dlopen()ed engine variant library.
class DynamicEngine : public NativeEngine {
public:
    static GateResult<std::unique_ptr<DynamicEngine>> open(const std::string& library_path);
    ~DynamicEngine() override;

    DynamicEngine(const DynamicEngine&) = delete;
    DynamicEngine& operator=(const DynamicEngine&) = delete;

    EngineHandle init_from_file(const std::string& model_path) override;
    EngineHandle init_from_stream(std::istream& stream) override;
    EngineHandle init_from_asset(AssetSource& assets, const std::string& asset_path) override;
    void destroy(EngineHandle handle) override;

    int full_transcribe(EngineHandle handle, int n_threads, const std::string& language,
                        std::span<const float> samples) override;
    int full_stream_transcribe(EngineHandle handle, int n_threads, const std::string& language,
                               std::span<const float> samples) override;

    int segment_count(EngineHandle handle) override;
    std::string segment_text(EngineHandle handle, int index) override;
    int64_t segment_t0(EngineHandle handle, int index) override;
    int64_t segment_t1(EngineHandle handle, int index) override;

    std::string system_info() override;
    std::string bench_memcpy(int n_threads) override;
    std::string bench_mul_mat(int n_threads) override;

    const std::string& library_path() const { return library_path_; }

private:
    struct Api {
        decltype(&speechgate_init_from_file) init_from_file = nullptr;
        decltype(&speechgate_init_from_stream) init_from_stream = nullptr;
        decltype(&speechgate_init_from_asset) init_from_asset = nullptr;
        decltype(&speechgate_free) free = nullptr;
        decltype(&speechgate_full_transcribe) full_transcribe = nullptr;
        decltype(&speechgate_full_stream_transcribe) full_stream_transcribe = nullptr;
        decltype(&speechgate_segment_count) segment_count = nullptr;
        decltype(&speechgate_segment_text) segment_text = nullptr;
        decltype(&speechgate_segment_t0) segment_t0 = nullptr;
        decltype(&speechgate_segment_t1) segment_t1 = nullptr;
        decltype(&speechgate_system_info) system_info = nullptr;
        decltype(&speechgate_bench_memcpy) bench_memcpy = nullptr;
        decltype(&speechgate_bench_mul_mat) bench_mul_mat = nullptr;
    };

    DynamicEngine(std::string library_path, void* lib, Api api);

    std::string library_path_;
    void* lib_ = nullptr;
    Api api_;
};
