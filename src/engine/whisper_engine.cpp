// Engine variant library: exports engine_abi.h on top of whisper.cpp.
// Built once per CPU variant with different code generation flags.

#include "native/engine_abi.h"

#include <cstdint>
#include <print>
#include <whisper.h>

namespace {

whisper_context* to_context(int64_t handle) {
    return reinterpret_cast<whisper_context*>(static_cast<intptr_t>(handle));
}

int64_t to_handle(whisper_context* ctx) {
    return static_cast<int64_t>(reinterpret_cast<intptr_t>(ctx));
}

whisper_full_params make_params(int n_threads, const char* language, bool streaming) {
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_realtime = !streaming;
    params.print_progress = false;
    params.print_timestamps = true;
    params.print_special = false;
    params.translate = false;
    params.language = language;
    params.n_threads = n_threads;
    params.offset_ms = 0;
    params.no_context = true;
    // Partial buffers from live capture are decoded as one segment.
    params.single_segment = streaming;
    return params;
}

int run_full(int64_t handle, whisper_full_params params, const float* samples, size_t n_samples) {
    auto* ctx = to_context(handle);
    if (!ctx) return -1;

    whisper_reset_timings(ctx);
    int rc = whisper_full(ctx, params, samples, static_cast<int>(n_samples));
    if (rc != 0) {
        std::println(stderr, "engine: failed to run the model ({})", rc);
        return rc;
    }
    whisper_print_timings(ctx);
    return 0;
}

} // namespace

extern "C" {

int64_t speechgate_init_from_file(const char* model_path) {
    auto* ctx = whisper_init_from_file_with_params(model_path, whisper_context_default_params());
    if (!ctx) std::println(stderr, "engine: couldn't load model {}", model_path);
    return to_handle(ctx);
}

int64_t speechgate_init_from_stream(speechgate_stream_reader* reader) {
    if (!reader || !reader->read || !reader->eof || !reader->close) return 0;

    whisper_model_loader loader = {};
    loader.context = reader->context;
    loader.read = reader->read;
    loader.eof = reader->eof;
    loader.close = reader->close;

    // whisper closes the loader on both success and failure.
    auto* ctx = whisper_init_with_params(&loader, whisper_context_default_params());
    if (!ctx) std::println(stderr, "engine: couldn't load model from stream");
    return to_handle(ctx);
}

int64_t speechgate_init_from_asset(const speechgate_asset_source* source, const char* asset_path) {
    if (!source || !source->open) return 0;

    speechgate_stream_reader reader = {};
    if (source->open(source->context, asset_path, &reader) != 0) {
        std::println(stderr, "engine: couldn't open asset {}", asset_path);
        return 0;
    }
    return speechgate_init_from_stream(&reader);
}

void speechgate_free(int64_t context) {
    auto* ctx = to_context(context);
    if (ctx) whisper_free(ctx);
}

int speechgate_full_transcribe(int64_t context, int n_threads, const char* language,
                               const float* samples, size_t n_samples) {
    return run_full(context, make_params(n_threads, language, false), samples, n_samples);
}

int speechgate_full_stream_transcribe(int64_t context, int n_threads, const char* language,
                                      const float* samples, size_t n_samples) {
    return run_full(context, make_params(n_threads, language, true), samples, n_samples);
}

int speechgate_segment_count(int64_t context) {
    auto* ctx = to_context(context);
    return ctx ? whisper_full_n_segments(ctx) : 0;
}

const char* speechgate_segment_text(int64_t context, int index) {
    auto* ctx = to_context(context);
    return ctx ? whisper_full_get_segment_text(ctx, index) : "";
}

int64_t speechgate_segment_t0(int64_t context, int index) {
    auto* ctx = to_context(context);
    return ctx ? whisper_full_get_segment_t0(ctx, index) : 0;
}

int64_t speechgate_segment_t1(int64_t context, int index) {
    auto* ctx = to_context(context);
    return ctx ? whisper_full_get_segment_t1(ctx, index) : 0;
}

const char* speechgate_system_info(void) {
    return whisper_print_system_info();
}

const char* speechgate_bench_memcpy(int n_threads) {
    return whisper_bench_memcpy_str(n_threads);
}

const char* speechgate_bench_mul_mat(int n_threads) {
    return whisper_bench_ggml_mul_mat_str(n_threads);
}

} // extern "C"
