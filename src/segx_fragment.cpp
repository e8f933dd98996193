#include "segx_fragment.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

uint32_t segx_segment_count(uint64_t file_size, size_t segment_size) {
    if (segment_size == 0) {
        throw std::invalid_argument("segx_segment_count: segment_size is zero");
    }
    uint64_t count = (file_size + segment_size - 1) / segment_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("segx_segment_count: file too large for 32-bit sequence numbers");
    }
    return static_cast<uint32_t>(count);
}

size_t segx_segment_length(uint32_t seq, uint64_t file_size, size_t segment_size) {
    uint64_t start = static_cast<uint64_t>(seq) * segment_size;
    if (start >= file_size) return 0;
    return static_cast<size_t>(std::min<uint64_t>(segment_size, file_size - start));
}

std::vector<SegxSegment> segx_fragment(const std::vector<uint8_t>& file, size_t segment_size) {
    uint32_t total = segx_segment_count(file.size(), segment_size);

    std::vector<SegxSegment> segments;
    segments.reserve(total);
    for (uint32_t i = 0; i < total; ++i) {
        size_t start = static_cast<size_t>(i) * segment_size;
        size_t end = std::min(start + segment_size, file.size());
        segments.push_back(SegxSegment{ i, std::vector<uint8_t>(file.begin() + start, file.begin() + end) });
    }
    return segments;
}

bool segx_reassemble(const std::vector<SegxSegment>& segments, std::vector<uint8_t>& out) {
    out.clear();

    size_t total = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].seq != i) return false;
        total += segments[i].data.size();
    }

    out.reserve(total);
    for (auto& s : segments) out.insert(out.end(), s.data.begin(), s.data.end());
    return true;
}
