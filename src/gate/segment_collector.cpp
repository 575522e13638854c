#include "segment_collector.hpp"

#include "timestamp.hpp"

#include <format>

std::string TranscriptionResult::text() const {
    std::string out;
    for (const auto& seg : segments) {
        out += seg.text;
    }
    return out;
}

std::string format_timestamped(const TranscriptionResult& result) {
    std::string out;
    for (const auto& seg : result.segments) {
        out += std::format("[{} --> {}]  {}\n", timestamp::format(seg.start),
                           timestamp::format(seg.end), seg.text);
    }
    return out;
}

TranscriptionResult SegmentCollector::collect(EngineHandle handle, bool with_timestamps) const {
    TranscriptionResult result;

    int count = engine_.segment_count(handle);
    if (count <= 0) return result;

    result.segments.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        TextSegment seg;
        seg.text = engine_.segment_text(handle, i);
        if (with_timestamps) {
            seg.start = engine_.segment_t0(handle, i);
            seg.end = engine_.segment_t1(handle, i);
        }
        result.segments.push_back(std::move(seg));
    }
    return result;
}
