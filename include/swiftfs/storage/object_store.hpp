#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace swiftfs {

// Reference from a manifest object to the segments it concatenates
// (Swift X-Object-Manifest: "<container>/<prefix>").
struct ManifestRef {
    std::string container;
    std::string prefix;

    std::string to_header() const { return container + "/" + prefix; }

    // Parse a header value; nullopt if it has no container component.
    static std::optional<ManifestRef> parse(const std::string& header);
};

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    std::optional<ManifestRef> manifest;
    std::map<std::string, std::string> user_metadata;
};

// Common status carried by every store result.
// status_code is the HTTP status of the remote call (0 for transport failures).
struct StoreResult {
    bool success = false;
    int status_code = 0;
    std::string error_message;

    bool not_found() const { return status_code == 404; }
};

struct HeadResult : StoreResult {
    ObjectMetadata metadata;
};

struct GetResult : StoreResult {
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
};

struct PutResult : StoreResult {
    std::string etag;
};

// Entry in a listing operation
struct ListEntry {
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    bool is_subdir = false;  // Delimiter grouping ("pseudo-directory"), not an object
};

struct ListResult : StoreResult {
    std::vector<ListEntry> entries;
};

struct BulkDeleteResult : StoreResult {
    size_t deleted = 0;
    size_t missing = 0;  // Already absent
    std::vector<std::string> errors;
};

// Fully qualified object name, used by bulk operations
struct ObjectPath {
    std::string container;
    std::string name;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::optional<ManifestRef> manifest;
    std::map<std::string, std::string> metadata;
};

// Options for get operations
struct GetOptions {
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;  // Exclusive
};

// Options for list operations. Empty delimiter lists the whole subtree.
struct ListOptions {
    std::string prefix;
    std::string delimiter;
};

// Optional features advertised by the store
struct StoreCapabilities {
    bool bulk_delete = false;
};

// Abstract interface for Swift-style object stores.
// All calls are blocking and report remote failures in the result's status;
// no call retries.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Create a container; succeeds if it already exists
    virtual StoreResult create_container(const std::string& container) = 0;

    // Get object metadata without downloading content
    virtual HeadResult head(const std::string& container,
                            const std::string& name) const = 0;

    // Read object content. A range starting at or past the end of the
    // object fails with status 416.
    virtual GetResult get(const std::string& container,
                          const std::string& name,
                          const GetOptions& options = {}) const = 0;

    // Write object content (whole body)
    virtual PutResult put(const std::string& container,
                          const std::string& name,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    virtual StoreResult remove(const std::string& container,
                               const std::string& name) = 0;

    // Delete many objects in one call. Only valid when capabilities()
    // reports bulk_delete.
    virtual BulkDeleteResult bulk_delete(const std::vector<ObjectPath>& objects) = 0;

    // List every object (all pages) in name order
    virtual ListResult list(const std::string& container,
                            const ListOptions& options = {}) const = 0;

    // Server-side copy. Copying a manifest copies its concatenated content.
    virtual StoreResult copy(const std::string& source_container,
                             const std::string& source_name,
                             const std::string& dest_container,
                             const std::string& dest_name) = 0;

    virtual StoreCapabilities capabilities() const = 0;
};

// Settings for the Swift client
struct SwiftStoreConfig {
    std::string username;
    std::string password;
    std::string auth_url;
    std::string tenant;
    std::string tenant_id;
    std::string domain;
    std::string domain_id;
    std::string region;
    bool insecure_skip_verify = false;
};

// Capability discovery endpoint for an auth URL: the auth URL with its last
// two path components removed, plus "/info".
std::string swift_info_url(const std::string& auth_url);

// Factory for creating object stores from configuration
class ObjectStoreFactory {
public:
    // Create a store from a parameter map ("swift" or "local").
    // Throws std::runtime_error on unknown types or failed authentication.
    static std::unique_ptr<ObjectStore> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);

    // Authenticate against Swift and return a connected client
    static std::unique_ptr<ObjectStore> create_swift(const SwiftStoreConfig& config);

    // Create a filesystem-backed store that emulates Swift semantics
    static std::unique_ptr<ObjectStore> create_local(
        const std::filesystem::path& root_path,
        bool bulk_delete = false);
};

} // namespace swiftfs
