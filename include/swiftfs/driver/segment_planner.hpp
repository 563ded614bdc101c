#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace swiftfs {

// --- Segment addressing ---

/// Name of the segments container paired with a primary container.
std::string segments_container_for(const std::string& container);

/// Prefix shared by every segment of the object stored at store_name
/// ("<store_name>/"). The trailing slash keeps "a" from matching "ab".
std::string segment_prefix_for(const std::string& store_name);

/// Name of the 1-based sequence-th segment under segment_prefix,
/// zero-padded so that name order equals sequence order.
std::string segment_name(const std::string& segment_prefix, uint64_t sequence);

/// Inverse of segment_name. nullopt for names that are not
/// segment_prefix followed by exactly the fixed number of digits.
std::optional<uint64_t> parse_segment_sequence(const std::string& segment_prefix,
                                               const std::string& name);

// --- Write planning ---

/// Where a write at a given offset lands.
///
/// Segments [1, first_sequence) are left untouched. padding_segments full
/// chunks are written starting at first_sequence (the first one keeps any
/// old bytes of a short terminal segment). Caller data then starts in
/// segment data_sequence, which begins at byte data_cursor.
struct SegmentPlan {
    uint64_t first_sequence = 1;
    uint64_t cursor = 0;             // Start of first_sequence
    uint64_t padding_segments = 0;
    uint64_t data_sequence = 1;
    uint64_t data_cursor = 0;        // Start of data_sequence

    /// Bytes of data_sequence that precede offset
    uint64_t prefix_length(uint64_t offset) const { return offset - data_cursor; }
};

/// Plan a write at offset on an object of current_length bytes whose
/// segments have the given lengths in sequence order.
///
/// A segment is skipped only when it is full and offset lies at or past its
/// end, so every non-terminal segment stays exactly chunk_size long: a short
/// terminal segment is always rewritten (completed) rather than followed.
SegmentPlan plan_write(uint64_t offset,
                       uint64_t current_length,
                       uint64_t chunk_size,
                       std::span<const uint64_t> segment_sizes);

}  // namespace swiftfs
