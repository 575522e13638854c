#include "transcription_session.hpp"

#include "cpu_topology.hpp"
#include "log.hpp"

#include <exception>
#include <format>
#include <print>

namespace {

GateError init_error(std::string message, std::string source) {
    std::println(stderr, "session: {}", message);
    return GateError{
        .kind = ErrorKind::Initialization,
        .message = std::move(message),
        .source = std::move(source),
    };
}

GateError released_error() {
    return GateError{
        .kind = ErrorKind::EngineInvocation,
        .message = "session has been released",
    };
}

} // namespace

GateResult<std::unique_ptr<TranscriptionSession>>
TranscriptionSession::from_file(NativeEngine& engine, const std::string& model_path,
                                SessionOptions options) {
    auto handle = engine.init_from_file(model_path);
    if (handle == invalid_handle) {
        return std::unexpected(init_error("couldn't create context with path " + model_path, model_path));
    }
    logging::debug("created context from {}", model_path);
    return std::unique_ptr<TranscriptionSession>(
        new TranscriptionSession(engine, handle, std::move(options)));
}

GateResult<std::unique_ptr<TranscriptionSession>>
TranscriptionSession::from_stream(NativeEngine& engine, std::istream& stream,
                                  SessionOptions options) {
    auto handle = engine.init_from_stream(stream);
    if (handle == invalid_handle) {
        return std::unexpected(init_error("couldn't create context from input stream", "input stream"));
    }
    logging::debug("created context from input stream");
    return std::unique_ptr<TranscriptionSession>(
        new TranscriptionSession(engine, handle, std::move(options)));
}

GateResult<std::unique_ptr<TranscriptionSession>>
TranscriptionSession::from_asset(NativeEngine& engine, AssetSource& assets,
                                 const std::string& asset_path, SessionOptions options) {
    auto handle = engine.init_from_asset(assets, asset_path);
    if (handle == invalid_handle) {
        return std::unexpected(init_error("couldn't create context from asset " + asset_path, asset_path));
    }
    logging::debug("created context from asset {}", asset_path);
    return std::unique_ptr<TranscriptionSession>(
        new TranscriptionSession(engine, handle, std::move(options)));
}

TranscriptionSession::TranscriptionSession(NativeEngine& engine, EngineHandle handle,
                                           SessionOptions options)
    : engine_(engine), handle_(handle), options_(std::move(options)), collector_(engine) {}

TranscriptionSession::~TranscriptionSession() {
    release();
}

GateResult<std::string> TranscriptionSession::transcribe(std::span<const float> samples,
                                                         const std::string& language,
                                                         bool /*emit_timestamps*/) {
    // The flattened text never carries timestamps, so they are not fetched.
    auto result = run(Mode::Full, samples, language, false);
    if (!result) return std::unexpected(result.error());
    return result->text();
}

GateResult<std::string> TranscriptionSession::stream_transcribe(std::span<const float> samples,
                                                                const std::string& language) {
    auto result = run(Mode::Stream, samples, language, false);
    if (!result) return std::unexpected(result.error());
    return result->text();
}

GateResult<TranscriptionResult>
TranscriptionSession::transcribe_segments(std::span<const float> samples,
                                          const std::string& language, bool emit_timestamps) {
    return run(Mode::Full, samples, language, emit_timestamps);
}

GateResult<TranscriptionResult>
TranscriptionSession::run(Mode mode, std::span<const float> samples,
                          const std::string& language, bool with_timestamps) {
    // Fast path only; the handle is checked again on the worker.
    if (!handle_.active()) return std::unexpected(released_error());

    auto outcome = gateway_.submit([&]() -> GateResult<TranscriptionResult> {
        std::lock_guard lock(native_mutex_);

        auto id = handle_.id();
        if (!id) return std::unexpected(released_error());

        int n_threads = thread_count();
        logging::debug("selecting {} threads", n_threads);

        int rc = mode == Mode::Full
            ? engine_.full_transcribe(*id, n_threads, language, samples)
            : engine_.full_stream_transcribe(*id, n_threads, language, samples);
        if (rc != 0) {
            std::println(stderr, "session: failed to run the model (status {})", rc);
            return std::unexpected(GateError{
                .kind = ErrorKind::EngineInvocation,
                .message = std::format("native transcribe failed with status {}", rc),
            });
        }

        return collector_.collect(*id, with_timestamps);
    });

    if (!outcome) return std::unexpected(outcome.error());
    return std::move(*outcome);
}

void TranscriptionSession::release() {
    bool queued = gateway_.post([this] {
        std::lock_guard lock(native_mutex_);
        auto id = handle_.take();
        if (!id) return;
        try {
            engine_.destroy(*id);
            logging::debug("context released");
        } catch (const std::exception& e) {
            std::println(stderr, "session: destroying context failed: {}", e.what());
        }
    });

    gateway_.shutdown();
    gateway_.join();

    if (!queued) logging::debug("release: session already closed");
}

SessionState TranscriptionSession::state() const {
    return handle_.active() ? SessionState::Active : SessionState::Released;
}

std::string TranscriptionSession::system_info(NativeEngine& engine) {
    return engine.system_info();
}

std::string TranscriptionSession::bench_memcpy(NativeEngine& engine, int n_threads) {
    return engine.bench_memcpy(n_threads);
}

std::string TranscriptionSession::bench_mul_mat(NativeEngine& engine, int n_threads) {
    return engine.bench_mul_mat(n_threads);
}

int TranscriptionSession::thread_count() const {
    if (options_.threads > 0) return options_.threads;
    return CpuTopology::from_system(options_.cpuinfo_path).preferred_thread_count();
}
