#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Decodes a 16-bit PCM WAV file held in memory into mono float samples.
namespace wav {

struct Pcm {
    std::vector<float> samples; // [-1, 1], stereo averaged to mono
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

inline std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos) {
        return std::string(reinterpret_cast<const char*>(bytes.data() + pos), 4);
    };

    if (bytes.size() < 12 || tag(0) != "RIFF" || tag(8) != "WAVE") {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Pcm pcm;
    uint16_t format = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        std::string id = tag(pos);
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + size > bytes.size()) {
            // Truncated data chunks are common; read what is there.
            if (id != "data") return std::unexpected("truncated " + id + " chunk");
            size = static_cast<uint32_t>(bytes.size() - body);
        }

        if (id == "fmt ") {
            if (size < 16) return std::unexpected("fmt chunk too small");
            format = r16(body);
            pcm.channels = r16(body + 2);
            pcm.sample_rate = r32(body + 4);
            bits_per_sample = r16(body + 14);
            have_fmt = true;
        } else if (id == "data") {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            if (format != 1 || bits_per_sample != 16) {
                return std::unexpected("only 16-bit PCM is supported");
            }
            if (pcm.channels != 1 && pcm.channels != 2) {
                return std::unexpected("only mono or stereo is supported");
            }

            size_t frame_bytes = pcm.channels * sizeof(int16_t);
            size_t frames = size / frame_bytes;
            pcm.samples.resize(frames);
            for (size_t i = 0; i < frames; ++i) {
                size_t at = body + i * frame_bytes;
                auto s0 = static_cast<int16_t>(r16(at));
                if (pcm.channels == 1) {
                    pcm.samples[i] = std::max(-1.0f, s0 / 32767.0f);
                } else {
                    auto s1 = static_cast<int16_t>(r16(at + 2));
                    pcm.samples[i] = std::max(-1.0f, (s0 + s1) / 2.0f / 32767.0f);
                }
            }
            return pcm;
        }

        // Chunks are word aligned.
        pos = body + size + (size & 1);
    }

    return std::unexpected("no data chunk");
}

} // namespace wav
