#pragma once

#include "../asset_source.hpp"

#include <cstdint>
#include <istream>
#include <span>
#include <string>

using EngineHandle = int64_t;

constexpr EngineHandle invalid_handle = 0;

// The native call surface. Implementations are not required to be
// thread-safe; callers must serialize every call for a given handle.
class NativeEngine {
public:
    virtual ~NativeEngine() = default;

    virtual EngineHandle init_from_file(const std::string& model_path) = 0;
    // Consumes the stream fully before returning.
    virtual EngineHandle init_from_stream(std::istream& stream) = 0;
    virtual EngineHandle init_from_asset(AssetSource& assets, const std::string& asset_path) = 0;
    virtual void destroy(EngineHandle handle) = 0;

    // Both return 0 on success.
    virtual int full_transcribe(EngineHandle handle, int n_threads, const std::string& language,
                                std::span<const float> samples) = 0;
    virtual int full_stream_transcribe(EngineHandle handle, int n_threads,
                                       const std::string& language,
                                       std::span<const float> samples) = 0;

    virtual int segment_count(EngineHandle handle) = 0;
    virtual std::string segment_text(EngineHandle handle, int index) = 0;
    // Centiseconds.
    virtual int64_t segment_t0(EngineHandle handle, int index) = 0;
    virtual int64_t segment_t1(EngineHandle handle, int index) = 0;

    virtual std::string system_info() = 0;
    virtual std::string bench_memcpy(int n_threads) = 0;
    virtual std::string bench_mul_mat(int n_threads) = 0;
};
