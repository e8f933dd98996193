#pragma once

#include "segx_protocol.h"

#include <cstddef>
#include <cstdint>
#include <vector>

struct SegxSegment {
    uint32_t seq;               // zero-based position in the file
    std::vector<uint8_t> data;  // at most segment_size bytes, only the last may be shorter
};

// ceil(file_size / segment_size); throws std::invalid_argument on segment_size == 0
uint32_t segx_segment_count(uint64_t file_size, size_t segment_size = kSegmentSize);

// Expected length of segment `seq` within a file of `file_size` bytes
size_t segx_segment_length(uint32_t seq, uint64_t file_size, size_t segment_size = kSegmentSize);

std::vector<SegxSegment> segx_fragment(const std::vector<uint8_t>& file,
                                       size_t segment_size = kSegmentSize);

// Concatenates segments that must be in sequence order 0..N-1.
// Returns false (and leaves `out` empty) on a gap or reordering.
bool segx_reassemble(const std::vector<SegxSegment>& segments, std::vector<uint8_t>& out);
