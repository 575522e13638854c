#pragma once

#include "native/native_engine.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct TextSegment {
    std::string text;
    // Centiseconds; left at 0 when timestamps were not requested.
    int64_t start = 0;
    int64_t end = 0;
};

struct TranscriptionResult {
    std::vector<TextSegment> segments;

    // Segment texts in index order, no separator.
    std::string text() const;
};

// "[00:00:00.000 --> 00:00:05.000]  text" per segment.
std::string format_timestamped(const TranscriptionResult& result);

// Copies the engine's current result buffer out. Must run in the same
// serialized task as the transcribe call that produced it.
class SegmentCollector {
public:
    explicit SegmentCollector(NativeEngine& engine) : engine_(engine) {}

    TranscriptionResult collect(EngineHandle handle, bool with_timestamps) const;

private:
    NativeEngine& engine_;
};
