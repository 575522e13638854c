#pragma once

/*
 * Flat C ABI exported by every engine variant library
 * (libspeechgate_engine.so, libspeechgate_engine_vfpv4.so,
 * libspeechgate_engine_v8fp16_va.so).
 *
 * A context handle is an opaque non-zero int64; 0 means "no context".
 * None of the functions below may be called concurrently for the same
 * handle. Strings returned by segment/info/bench functions are owned by the
 * library and stay valid only until the next call on the same handle.
 */

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct speechgate_stream_reader {
    void* context;
    size_t (*read)(void* context, void* output, size_t read_size);
    bool (*eof)(void* context);
    void (*close)(void* context);
} speechgate_stream_reader;

typedef struct speechgate_asset_source {
    void* context;
    /* Fills reader and returns 0, or returns non-zero if the asset is missing. */
    int (*open)(void* context, const char* asset_path, speechgate_stream_reader* reader);
} speechgate_asset_source;

int64_t speechgate_init_from_file(const char* model_path);
int64_t speechgate_init_from_stream(speechgate_stream_reader* reader);
int64_t speechgate_init_from_asset(const speechgate_asset_source* source, const char* asset_path);
void speechgate_free(int64_t context);

int speechgate_full_transcribe(int64_t context, int n_threads, const char* language,
                               const float* samples, size_t n_samples);
int speechgate_full_stream_transcribe(int64_t context, int n_threads, const char* language,
                                      const float* samples, size_t n_samples);

int speechgate_segment_count(int64_t context);
const char* speechgate_segment_text(int64_t context, int index);
int64_t speechgate_segment_t0(int64_t context, int index);
int64_t speechgate_segment_t1(int64_t context, int index);

const char* speechgate_system_info(void);
const char* speechgate_bench_memcpy(int n_threads);
const char* speechgate_bench_mul_mat(int n_threads);

#ifdef __cplusplus
}
#endif
