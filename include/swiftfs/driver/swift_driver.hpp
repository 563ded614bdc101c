#pragma once

#include "swiftfs/driver/segment_planner.hpp"
#include "swiftfs/driver/storage_driver.hpp"
#include "swiftfs/driver_config.hpp"
#include "swiftfs/storage/object_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace swiftfs {

class DriverMetrics;

/// StorageDriver over a Swift-style object store.
///
/// Small objects (put_content) are stored whole. write_stream turns the
/// target into a dynamic large object: a zero-length manifest in the
/// primary container referencing fixed-size segments named
/// "<store name>/<sequence>" in "<container>_segments".
///
/// Not thread-safe; concurrent writers to the same path are not coordinated.
class SwiftDriver : public StorageDriver {
public:
    /// Takes ownership of store. Creates both containers and reads the
    /// store's capabilities once. Throws std::runtime_error if the
    /// parameters are invalid or a container cannot be created.
    SwiftDriver(std::unique_ptr<ObjectStore> store,
                const DriverParameters& params,
                DriverMetrics* metrics = nullptr);

    /// Authenticate against Swift with params and build a driver.
    /// Throws std::runtime_error on failure.
    static std::unique_ptr<SwiftDriver> create(const DriverParameters& params,
                                               DriverMetrics* metrics = nullptr);

    std::string name() const override;

    ContentResult get_content(const std::string& path) override;
    DriverError put_content(const std::string& path,
                            const std::vector<uint8_t>& content) override;
    ReadStreamResult read_stream(const std::string& path, uint64_t offset) override;
    WriteResult write_stream(const std::string& path, uint64_t offset,
                             std::istream& reader) override;
    StatResult stat(const std::string& path) override;
    ListPathsResult list(const std::string& path) override;
    DriverError move(const std::string& source, const std::string& dest) override;
    DriverError remove(const std::string& path) override;
    UrlResult url_for(const std::string& path) override;

    const std::string& container() const { return container_; }
    const std::string& segments_container() const { return segments_container_; }
    uint64_t chunk_size() const { return chunk_size_; }
    bool bulk_delete_supported() const { return bulk_delete_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    /// Store name ("<prefix>/<path>" without leading slash) for a logical path
    std::string store_name(const std::string& path) const;

    /// Logical path for a store name under the driver prefix
    std::string logical_path(const std::string& store_name) const;

private:
    // Manifest Manager: make sure store_name is a manifest before segments
    // are written (creating parents, purging stale segments, adopting a
    // plain object).
    DriverError ensure_manifest(const std::string& path, const std::string& store_name);

    // Zero-length application/directory markers for every ancestor of path
    DriverError create_parent_dirs(const std::string& path);

    // Lengths of the contiguous segments 1..n under segment_prefix
    DriverError segment_sizes(const std::string& path, const std::string& segment_prefix,
                              std::vector<uint64_t>& sizes);

    // Padding Engine: full zero chunks from plan.first_sequence up to
    // plan.data_sequence, keeping old bytes of a short terminal segment.
    DriverError write_padding_segments(const std::string& path,
                                       const std::string& segment_prefix,
                                       const SegmentPlan& plan,
                                       const std::vector<uint64_t>& sizes);

    // Bytes [start, end) of an existing segment
    DriverError read_segment_range(const std::string& path, const std::string& segment,
                                   uint64_t start, uint64_t end, std::vector<uint8_t>& out);

    DriverError put_segment(const std::string& path, const std::string& segment,
                            const std::vector<uint8_t>& data);

    // Segment Collector: delete every segment under a manifest reference
    DriverError collect_segments(const std::string& path, const ManifestRef& manifest);

    // Objects in the primary container at store_name or below it
    DriverError enumerate_subtree(const std::string& path, const std::string& store_name,
                                  std::vector<std::string>& names);

    DriverError bulk_remove(const std::string& path, const std::string& store_name,
                            const std::vector<std::string>& names);

    DriverError remove_each(const std::string& path, const std::vector<std::string>& names);

    // Every segment of store_name and of the objects below it
    DriverError remove_segment_tree(const std::string& path, const std::string& store_name);

    void finish(const char* operation, const DriverError& error);

    std::unique_ptr<ObjectStore> store_;
    DriverMetrics* metrics_;  // Not owned, may be null
    std::string container_;
    std::string segments_container_;
    std::string prefix_;      // Normalized: no leading or trailing slash
    uint64_t chunk_size_;
    const bool bulk_delete_;  // Read once at construction
    bool verbose_ = false;
};

}  // namespace swiftfs
