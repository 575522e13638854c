#pragma once

#include "asset_source.hpp"
#include "errors.hpp"
#include "native/native_engine.hpp"
#include "native/native_handle.hpp"
#include "segment_collector.hpp"
#include "serial_gateway.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <span>
#include <string>

enum class SessionState { Active, Released };

struct SessionOptions {
    // 0: derive from the CPU topology on every call.
    int threads = 0;
    std::string cpuinfo_path = "/proc/cpuinfo";
};

// One loaded model plus the single worker through which every native call
// for it is made. Callers on any thread may transcribe; calls are executed
// one at a time in submission order.
//
// Release explicitly (or let the owning unique_ptr go out of scope); the
// destructor releases as a backstop.
class TranscriptionSession {
public:
    static GateResult<std::unique_ptr<TranscriptionSession>>
        from_file(NativeEngine& engine, const std::string& model_path, SessionOptions options = {});
    static GateResult<std::unique_ptr<TranscriptionSession>>
        from_stream(NativeEngine& engine, std::istream& stream, SessionOptions options = {});
    static GateResult<std::unique_ptr<TranscriptionSession>>
        from_asset(NativeEngine& engine, AssetSource& assets, const std::string& asset_path,
                   SessionOptions options = {});

    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    // Samples: mono float at 16 kHz. Returns the segment texts concatenated.
    // emit_timestamps does not change the returned text.
    GateResult<std::string> transcribe(std::span<const float> samples,
                                       const std::string& language = "en",
                                       bool emit_timestamps = true);

    // For partial buffers arriving during live capture.
    GateResult<std::string> stream_transcribe(std::span<const float> samples,
                                              const std::string& language = "en");

    // Start/end are filled only when emit_timestamps is set.
    GateResult<TranscriptionResult> transcribe_segments(std::span<const float> samples,
                                                        const std::string& language = "en",
                                                        bool emit_timestamps = true);

    // Queues destruction of the native handle behind any work already
    // submitted, closes the gateway and waits for it to drain. Idempotent.
    void release();

    SessionState state() const;
    size_t pending_tasks() const { return gateway_.pending(); }

    static std::string system_info(NativeEngine& engine);
    static std::string bench_memcpy(NativeEngine& engine, int n_threads);
    static std::string bench_mul_mat(NativeEngine& engine, int n_threads);

private:
    enum class Mode { Full, Stream };

    TranscriptionSession(NativeEngine& engine, EngineHandle handle, SessionOptions options);

    GateResult<TranscriptionResult> run(Mode mode, std::span<const float> samples,
                                        const std::string& language, bool with_timestamps);
    int thread_count() const;

    NativeEngine& engine_;
    NativeHandle handle_;
    SessionOptions options_;
    SegmentCollector collector_;

    // Taken inside every task, in addition to the queue ordering.
    std::mutex native_mutex_;

    SerialGateway gateway_;
};
