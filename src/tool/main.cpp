#include "asset_source.hpp"
#include "backend_selector.hpp"
#include "config.hpp"
#include "log.hpp"
#include "timestamp.hpp"
#include "transcription_session.hpp"
#include "wav_decoder.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <print>
#include <string>
#include <vector>

namespace {

constexpr uint32_t engine_sample_rate = 16000;

void print_usage() {
    std::println("Usage: speechgate [options]");
    std::println("Options:");
    std::println("  -m, --model PATH        Model file");
    std::println("      --model-stream PATH Model file, loaded as a byte stream");
    std::println("  -a, --asset PATH        Model asset under assets.root");
    std::println("  -f, --file WAV          16 kHz 16-bit PCM WAV to transcribe");
    std::println("  -l, --language LANG     Language code (default from config)");
    std::println("  -s, --stream            Use the streaming transcribe call");
    std::println("  -t, --timestamps        Print timestamped segments");
    std::println("      --srt               Print SRT subtitles");
    std::println("  -i, --system-info       Print engine system info");
    std::println("  -b, --bench THREADS     Run the memcpy and mul_mat benchmarks");
    std::println("  -c, --config PATH       Config file path");
    std::println("  -v, --verbose           Enable verbose logging");
    std::println("  -h, --help              Show this help");
}

std::string to_srt(const TranscriptionResult& result) {
    std::string out;
    int n = 1;
    for (const auto& seg : result.segments) {
        out += std::format("{}\n{} --> {}\n{}\n\n", n++, timestamp::format(seg.start, true),
                           timestamp::format(seg.end, true), seg.text);
    }
    return out;
}

std::expected<std::vector<float>, std::string> load_audio(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("could not open " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    auto pcm = wav::decode(bytes);
    if (!pcm) return std::unexpected(path + ": " + pcm.error());
    if (pcm->sample_rate != engine_sample_rate) {
        return std::unexpected(std::format("{}: sample rate is {} Hz, expected {} Hz",
                                           path, pcm->sample_rate, engine_sample_rate));
    }
    return std::move(pcm->samples);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string model_path;
    std::string model_stream_path;
    std::string asset_path;
    std::string audio_path;
    std::string language;
    bool streaming = false;
    bool timestamps = false;
    bool srt = false;
    bool system_info = false;
    int bench_threads = 0;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : std::string(); };

        if (arg == "--model" || arg == "-m") {
            model_path = next();
        } else if (arg == "--model-stream") {
            model_stream_path = next();
        } else if (arg == "--asset" || arg == "-a") {
            asset_path = next();
        } else if (arg == "--file" || arg == "-f") {
            audio_path = next();
        } else if (arg == "--language" || arg == "-l") {
            language = next();
        } else if (arg == "--stream" || arg == "-s") {
            streaming = true;
        } else if (arg == "--timestamps" || arg == "-t") {
            timestamps = true;
        } else if (arg == "--srt") {
            srt = true;
        } else if (arg == "--system-info" || arg == "-i") {
            system_info = true;
        } else if (arg == "--bench" || arg == "-b") {
            bench_threads = std::atoi(next().c_str());
        } else if (arg == "--config" || arg == "-c") {
            config_path = next();
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    logging::set_verbose(verbose || config.log.verbose);
    if (language.empty()) language = config.transcription.language;

    // Backend load failure is fatal: no other variant is tried.
    auto engine = ensure_backend_loaded(config.backend);
    if (!engine) {
        std::println(stderr, "Failed to load engine backend: {}", engine.error().message);
        return 1;
    }

    if (system_info) {
        std::println("{}", TranscriptionSession::system_info(**engine));
    }
    if (bench_threads > 0) {
        std::print("{}", TranscriptionSession::bench_memcpy(**engine, bench_threads));
        std::print("{}", TranscriptionSession::bench_mul_mat(**engine, bench_threads));
    }

    if (model_path.empty() && model_stream_path.empty() && asset_path.empty()) {
        if (!system_info && bench_threads == 0) {
            print_usage();
            return 1;
        }
        return 0;
    }

    if (audio_path.empty()) {
        std::println(stderr, "No audio file given (--file)");
        return 1;
    }

    auto audio = load_audio(audio_path);
    if (!audio) {
        std::println(stderr, "{}", audio.error());
        return 1;
    }

    SessionOptions options{.threads = config.transcription.threads,
                           .cpuinfo_path = config.backend.cpuinfo_path};

    std::ifstream model_stream;
    DirectoryAssetSource assets(config.assets.root);
    GateResult<std::unique_ptr<TranscriptionSession>> session =
        std::unexpected(GateError{.kind = ErrorKind::Initialization, .message = "no model source"});

    if (!model_path.empty()) {
        session = TranscriptionSession::from_file(**engine, model_path, options);
    } else if (!model_stream_path.empty()) {
        model_stream.open(model_stream_path, std::ios::binary);
        if (!model_stream.is_open()) {
            std::println(stderr, "Could not open {}", model_stream_path);
            return 1;
        }
        session = TranscriptionSession::from_stream(**engine, model_stream, options);
    } else {
        session = TranscriptionSession::from_asset(**engine, assets, asset_path, options);
    }

    if (!session) {
        std::println(stderr, "Failed to create session ({}): {}",
                     error_kind_name(session.error().kind), session.error().message);
        return 1;
    }

    auto& s = **session;
    int rc = 0;
    try {
        if (timestamps || srt) {
            auto result = s.transcribe_segments(*audio, language, true);
            if (result) {
                std::print("{}", srt ? to_srt(*result) : format_timestamped(*result));
            } else {
                std::println(stderr, "Transcription failed: {}", result.error().message);
                rc = 1;
            }
        } else {
            auto text = streaming ? s.stream_transcribe(*audio, language)
                                  : s.transcribe(*audio, language, config.transcription.emit_timestamps);
            if (text) {
                std::println("{}", *text);
            } else {
                std::println(stderr, "Transcription failed: {}", text.error().message);
                rc = 1;
            }
        }
    } catch (const std::exception& e) {
        std::println(stderr, "Transcription failed: {}", e.what());
        rc = 1;
    }

    s.release();
    return rc;
}
