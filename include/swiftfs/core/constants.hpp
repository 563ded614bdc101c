#pragma once

#include <cstddef>
#include <cstdint>

namespace swiftfs::constants {

// Driver identity
constexpr const char* DRIVER_NAME = "swift";
constexpr const char* USER_AGENT = "swiftfs/1.0";

// Segmentation
constexpr uint64_t DEFAULT_CHUNK_SIZE = 20 * 1024 * 1024;   // 20MB
constexpr uint64_t MIN_CHUNK_SIZE = 1 << 20;                 // 1MB
constexpr size_t SEGMENT_NUMBER_DIGITS = 16;
constexpr const char* SEGMENTS_CONTAINER_SUFFIX = "_segments";

// Content types
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";
constexpr const char* DIRECTORY_CONTENT_TYPE = "application/directory";

// Swift headers
constexpr const char* OBJECT_MANIFEST_HEADER = "X-Object-Manifest";
constexpr const char* AUTH_TOKEN_HEADER = "X-Auth-Token";

// Listing page size (Swift default container_listing_limit)
constexpr size_t LIST_PAGE_SIZE = 10000;

// Objects per bulk-delete request (Swift default max_deletes_per_request)
constexpr size_t BULK_DELETE_MAX_OBJECTS = 10000;

// HTTP request defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 60;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 15 * 60;

} // namespace swiftfs::constants
