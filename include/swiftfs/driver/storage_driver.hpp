#pragma once

#include "swiftfs/storage/object_store.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace swiftfs {

enum class DriverErrorCode {
    None,
    PathNotFound,
    InvalidPath,
    Unsupported,
    Remote
};

const char* driver_error_code_to_string(DriverErrorCode code);

/// Error carried by every driver result. code == None means success.
struct DriverError {
    DriverErrorCode code = DriverErrorCode::None;
    std::string path;
    int status_code = 0;       // Remote HTTP status, 0 if not applicable
    std::string message;

    bool ok() const { return code == DriverErrorCode::None; }
    std::string to_string() const;

    static DriverError path_not_found(const std::string& path);
    static DriverError invalid_path(const std::string& path);
    static DriverError unsupported(const std::string& path, const std::string& what);
};

/// Map a failed store call to the driver's error taxonomy.
/// 404 becomes PathNotFound; every other failure is Remote and keeps the
/// store's status and message.
DriverError translate_store_error(const std::string& path, const StoreResult& result);

struct FileInfo {
    std::string path;
    uint64_t size = 0;
    bool is_dir = false;
    std::chrono::system_clock::time_point mod_time;
};

struct ContentResult {
    DriverError error;
    std::vector<uint8_t> data;
};

struct ReadStreamResult {
    DriverError error;
    std::unique_ptr<std::istream> stream;
};

struct WriteResult {
    DriverError error;
    uint64_t bytes_written = 0;  // Caller bytes committed; resume at offset + bytes_written
};

struct StatResult {
    DriverError error;
    FileInfo info;
};

struct ListPathsResult {
    DriverError error;
    std::vector<std::string> paths;  // Logical paths, sorted
};

struct UrlResult {
    DriverError error;
    std::string url;
};

/// Random-access file abstraction over an object store.
/// Paths are absolute: "/" followed by components of [A-Za-z0-9._-].
class StorageDriver {
public:
    virtual ~StorageDriver() = default;

    virtual std::string name() const = 0;

    virtual ContentResult get_content(const std::string& path) = 0;

    // Whole-object write; never segmented
    virtual DriverError put_content(const std::string& path,
                                    const std::vector<uint8_t>& content) = 0;

    // Stream starting at offset. An offset at or past the end yields an
    // empty stream.
    virtual ReadStreamResult read_stream(const std::string& path, uint64_t offset) = 0;

    // Write the reader's bytes starting at offset, extending the object with
    // zeros when offset lies past the current end.
    virtual WriteResult write_stream(const std::string& path, uint64_t offset,
                                     std::istream& reader) = 0;

    virtual StatResult stat(const std::string& path) = 0;

    // Immediate children of path
    virtual ListPathsResult list(const std::string& path) = 0;

    virtual DriverError move(const std::string& source, const std::string& dest) = 0;

    // Recursive delete of path and everything below it
    virtual DriverError remove(const std::string& path) = 0;

    virtual UrlResult url_for(const std::string& path) = 0;
};

/// True if path is "/" followed by one or more [A-Za-z0-9._-] components.
bool is_valid_path(const std::string& path);

}  // namespace swiftfs
