#include <catch2/catch_test_macros.hpp>

#include "wav_decoder.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(v & 0xff);
    out.push_back(v >> 8);
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) out.push_back((v >> (8 * i)) & 0xff);
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

std::vector<uint8_t> fmt_chunk(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits) {
    std::vector<uint8_t> out;
    put_tag(out, "fmt ");
    put32(out, 16);
    put16(out, format);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * bits / 8);
    put16(out, static_cast<uint16_t>(channels * bits / 8));
    put16(out, bits);
    return out;
}

std::vector<uint8_t> data_chunk(std::initializer_list<int16_t> samples) {
    std::vector<uint8_t> out;
    put_tag(out, "data");
    put32(out, static_cast<uint32_t>(samples.size() * 2));
    for (int16_t s : samples) put16(out, static_cast<uint16_t>(s));
    return out;
}

std::vector<uint8_t> riff(std::initializer_list<std::vector<uint8_t>> chunks) {
    std::vector<uint8_t> body;
    put_tag(body, "WAVE");
    for (const auto& c : chunks) body.insert(body.end(), c.begin(), c.end());

    std::vector<uint8_t> out;
    put_tag(out, "RIFF");
    put32(out, static_cast<uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace

TEST_CASE("WavDecoder", "[wav]") {

    SECTION("Mono16") {
        auto bytes = riff({fmt_chunk(1, 1, 16000, 16), data_chunk({0, 32767, -32768, 16384})});
        auto pcm = wav::decode(bytes);
        REQUIRE(pcm);
        REQUIRE(pcm->sample_rate == 16000);
        REQUIRE(pcm->channels == 1);
        REQUIRE(pcm->samples.size() == 4);
        REQUIRE(pcm->samples[0] == 0.0f);
        REQUIRE(pcm->samples[1] == 1.0f);
        REQUIRE(pcm->samples[2] == -1.0f);
        REQUIRE(pcm->samples[3] > 0.49f);
        REQUIRE(pcm->samples[3] < 0.51f);
    }

    SECTION("StereoIsAveraged") {
        auto bytes = riff({fmt_chunk(1, 2, 16000, 16), data_chunk({32767, -32767, 32767, 32767})});
        auto pcm = wav::decode(bytes);
        REQUIRE(pcm);
        REQUIRE(pcm->channels == 2);
        REQUIRE(pcm->samples.size() == 2);
        REQUIRE(pcm->samples[0] == 0.0f);
        REQUIRE(pcm->samples[1] == 1.0f);
    }

    SECTION("SkipsUnknownChunks") {
        std::vector<uint8_t> list;
        put_tag(list, "LIST");
        put32(list, 3);
        list.insert(list.end(), {'a', 'b', 'c', 0}); // odd size, padded
        auto bytes = riff({fmt_chunk(1, 1, 16000, 16), list, data_chunk({100, 200})});
        auto pcm = wav::decode(bytes);
        REQUIRE(pcm);
        REQUIRE(pcm->samples.size() == 2);
    }

    SECTION("TruncatedDataReadsWhatIsThere") {
        auto bytes = riff({fmt_chunk(1, 1, 16000, 16), data_chunk({1, 2, 3, 4})});
        bytes.resize(bytes.size() - 3);
        auto pcm = wav::decode(bytes);
        REQUIRE(pcm);
        REQUIRE(pcm->samples.size() == 2);
    }

    SECTION("NotRiff") {
        std::vector<uint8_t> bytes(64, 0);
        auto pcm = wav::decode(bytes);
        REQUIRE_FALSE(pcm);
        REQUIRE(pcm.error() == "not a RIFF/WAVE file");
    }

    SECTION("NoDataChunk") {
        auto pcm = wav::decode(riff({fmt_chunk(1, 1, 16000, 16)}));
        REQUIRE_FALSE(pcm);
        REQUIRE(pcm.error() == "no data chunk");
    }

    SECTION("DataBeforeFmt") {
        auto pcm = wav::decode(riff({data_chunk({1}), fmt_chunk(1, 1, 16000, 16)}));
        REQUIRE_FALSE(pcm);
        REQUIRE(pcm.error() == "data chunk before fmt chunk");
    }

    SECTION("RejectsFloatAndEightBit") {
        auto as_float = wav::decode(riff({fmt_chunk(3, 1, 16000, 32), data_chunk({0, 0})}));
        REQUIRE_FALSE(as_float);
        REQUIRE(as_float.error() == "only 16-bit PCM is supported");

        auto eight_bit = wav::decode(riff({fmt_chunk(1, 1, 16000, 8), data_chunk({0})}));
        REQUIRE_FALSE(eight_bit);
        REQUIRE(eight_bit.error() == "only 16-bit PCM is supported");
    }

    SECTION("RejectsMultichannel") {
        auto pcm = wav::decode(riff({fmt_chunk(1, 6, 16000, 16), data_chunk({0, 0, 0, 0, 0, 0})}));
        REQUIRE_FALSE(pcm);
        REQUIRE(pcm.error() == "only mono or stereo is supported");
    }
}
