#include "native/dynamic_engine.hpp"

#include <dlfcn.h>
#include <exception>
#include <format>
#include <memory>
#include <print>
#include <type_traits>

namespace {

// Adapts a std::istream to speechgate_stream_reader. `owned` is set when the
// reader must free the stream on close (asset streams).
struct StreamContext {
    std::istream* in;
    std::unique_ptr<std::istream> owned;
};

size_t stream_read(void* context, void* output, size_t read_size) {
    auto* ctx = static_cast<StreamContext*>(context);
    ctx->in->read(static_cast<char*>(output), static_cast<std::streamsize>(read_size));
    return static_cast<size_t>(ctx->in->gcount());
}

bool stream_eof(void* context) {
    auto* ctx = static_cast<StreamContext*>(context);
    return ctx->in->peek() == std::istream::traits_type::eof();
}

void close_borrowed(void* /*context*/) {}

// Takes back ownership handed to the engine in open_asset.
void close_owned(void* context) {
    std::unique_ptr<StreamContext> ctx(static_cast<StreamContext*>(context));
}

int open_asset(void* context, const char* asset_path, speechgate_stream_reader* reader) {
    auto* assets = static_cast<AssetSource*>(context);

    std::unique_ptr<std::istream> in;
    try {
        in = assets->open(asset_path);
    } catch (const std::exception& e) {
        std::println(stderr, "engine: opening asset {} failed: {}", asset_path, e.what());
        return 1;
    }
    if (!in) return 1;

    auto* stream = in.get();
    auto ctx = std::make_unique<StreamContext>(StreamContext{stream, std::move(in)});
    *reader = speechgate_stream_reader{
        .context = ctx.release(),
        .read = stream_read,
        .eof = stream_eof,
        .close = close_owned,
    };
    return 0;
}

std::string copy_string(const char* s) {
    return s ? std::string(s) : std::string();
}

} // namespace

GateResult<std::unique_ptr<DynamicEngine>> DynamicEngine::open(const std::string& library_path) {
    void* lib = dlopen(library_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!lib) {
        const char* err = dlerror();
        return std::unexpected(GateError{
            .kind = ErrorKind::BackendLoad,
            .message = std::format("couldn't load {}: {}", library_path, err ? err : "unknown error"),
            .source = library_path,
        });
    }

    Api api;
    std::string missing;
    auto resolve = [&](auto& fn, const char* name) {
        fn = reinterpret_cast<std::remove_reference_t<decltype(fn)>>(dlsym(lib, name));
        if (!fn) {
            if (!missing.empty()) missing += ", ";
            missing += name;
        }
    };

    resolve(api.init_from_file, "speechgate_init_from_file");
    resolve(api.init_from_stream, "speechgate_init_from_stream");
    resolve(api.init_from_asset, "speechgate_init_from_asset");
    resolve(api.free, "speechgate_free");
    resolve(api.full_transcribe, "speechgate_full_transcribe");
    resolve(api.full_stream_transcribe, "speechgate_full_stream_transcribe");
    resolve(api.segment_count, "speechgate_segment_count");
    resolve(api.segment_text, "speechgate_segment_text");
    resolve(api.segment_t0, "speechgate_segment_t0");
    resolve(api.segment_t1, "speechgate_segment_t1");
    resolve(api.system_info, "speechgate_system_info");
    resolve(api.bench_memcpy, "speechgate_bench_memcpy");
    resolve(api.bench_mul_mat, "speechgate_bench_mul_mat");

    if (!missing.empty()) {
        dlclose(lib);
        return std::unexpected(GateError{
            .kind = ErrorKind::BackendLoad,
            .message = std::format("{} is missing symbols: {}", library_path, missing),
            .source = library_path,
        });
    }

    return std::unique_ptr<DynamicEngine>(new DynamicEngine(library_path, lib, api));
}

DynamicEngine::DynamicEngine(std::string library_path, void* lib, Api api)
    : library_path_(std::move(library_path)), lib_(lib), api_(api) {}

DynamicEngine::~DynamicEngine() {
    if (lib_) dlclose(lib_);
}

EngineHandle DynamicEngine::init_from_file(const std::string& model_path) {
    return api_.init_from_file(model_path.c_str());
}

EngineHandle DynamicEngine::init_from_stream(std::istream& stream) {
    StreamContext ctx{&stream, nullptr};
    speechgate_stream_reader reader{
        .context = &ctx,
        .read = stream_read,
        .eof = stream_eof,
        .close = close_borrowed,
    };
    return api_.init_from_stream(&reader);
}

EngineHandle DynamicEngine::init_from_asset(AssetSource& assets, const std::string& asset_path) {
    speechgate_asset_source source{
        .context = &assets,
        .open = open_asset,
    };
    return api_.init_from_asset(&source, asset_path.c_str());
}

void DynamicEngine::destroy(EngineHandle handle) {
    api_.free(handle);
}

int DynamicEngine::full_transcribe(EngineHandle handle, int n_threads,
                                   const std::string& language,
                                   std::span<const float> samples) {
    return api_.full_transcribe(handle, n_threads, language.c_str(),
                                samples.data(), samples.size());
}

int DynamicEngine::full_stream_transcribe(EngineHandle handle, int n_threads,
                                          const std::string& language,
                                          std::span<const float> samples) {
    return api_.full_stream_transcribe(handle, n_threads, language.c_str(),
                                       samples.data(), samples.size());
}

int DynamicEngine::segment_count(EngineHandle handle) {
    return api_.segment_count(handle);
}

std::string DynamicEngine::segment_text(EngineHandle handle, int index) {
    return copy_string(api_.segment_text(handle, index));
}

int64_t DynamicEngine::segment_t0(EngineHandle handle, int index) {
    return api_.segment_t0(handle, index);
}

int64_t DynamicEngine::segment_t1(EngineHandle handle, int index) {
    return api_.segment_t1(handle, index);
}

std::string DynamicEngine::system_info() {
    return copy_string(api_.system_info());
}

std::string DynamicEngine::bench_memcpy(int n_threads) {
    return copy_string(api_.bench_memcpy(n_threads));
}

std::string DynamicEngine::bench_mul_mat(int n_threads) {
    return copy_string(api_.bench_mul_mat(n_threads));
}
