#include "swiftfs/driver/segment_planner.hpp"
#include "swiftfs/core/constants.hpp"

#include <cctype>
#include <cstdio>

namespace swiftfs {

std::string segments_container_for(const std::string& container) {
    return container + constants::SEGMENTS_CONTAINER_SUFFIX;
}

std::string segment_prefix_for(const std::string& store_name) {
    return store_name + "/";
}

std::string segment_name(const std::string& segment_prefix, uint64_t sequence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*llu",
                  static_cast<int>(constants::SEGMENT_NUMBER_DIGITS),
                  static_cast<unsigned long long>(sequence));
    return segment_prefix + buf;
}

std::optional<uint64_t> parse_segment_sequence(const std::string& segment_prefix,
                                               const std::string& name) {
    if (name.size() != segment_prefix.size() + constants::SEGMENT_NUMBER_DIGITS ||
        name.compare(0, segment_prefix.size(), segment_prefix) != 0) {
        return std::nullopt;
    }
    uint64_t sequence = 0;
    for (size_t i = segment_prefix.size(); i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return std::nullopt;
        }
        sequence = sequence * 10 + static_cast<uint64_t>(name[i] - '0');
    }
    if (sequence == 0) {
        return std::nullopt;
    }
    return sequence;
}

SegmentPlan plan_write(uint64_t offset,
                       uint64_t current_length,
                       uint64_t chunk_size,
                       std::span<const uint64_t> segment_sizes) {
    SegmentPlan plan;

    for (uint64_t size : segment_sizes) {
        if (size != chunk_size || offset < plan.cursor + chunk_size) {
            break;
        }
        plan.cursor += chunk_size;
        ++plan.first_sequence;
    }

    // Whole chunks between the end of data and offset become padding.
    // When current_length > cursor the first of them completes the short
    // terminal segment.
    plan.data_sequence = plan.first_sequence;
    plan.data_cursor = plan.cursor;
    if (offset >= current_length) {
        while (offset - plan.data_cursor >= chunk_size) {
            ++plan.padding_segments;
            ++plan.data_sequence;
            plan.data_cursor += chunk_size;
        }
    }
    return plan;
}

}  // namespace swiftfs
