#include "swiftfs/driver/swift_driver.hpp"
#include "swiftfs/core/constants.hpp"
#include "swiftfs/metrics.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace swiftfs {

namespace {

// Diagnostics go to stderr; stdout carries object content in the CLI
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

std::string normalize_prefix(const std::string& prefix) {
    size_t begin = prefix.find_first_not_of('/');
    if (begin == std::string::npos) return {};
    size_t end = prefix.find_last_not_of('/');
    return prefix.substr(begin, end - begin + 1);
}

std::unique_ptr<ObjectStore> require_store(std::unique_ptr<ObjectStore> store) {
    if (!store) {
        throw std::runtime_error("SwiftDriver requires an object store");
    }
    return store;
}

DriverError reader_failure(const std::string& path) {
    return {DriverErrorCode::Remote, path, 0, "failed to read source data"};
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

SwiftDriver::SwiftDriver(std::unique_ptr<ObjectStore> store,
                         const DriverParameters& params,
                         DriverMetrics* metrics)
    : store_(require_store(std::move(store)))
    , metrics_(metrics)
    , container_(params.container)
    , segments_container_(segments_container_for(params.container))
    , prefix_(normalize_prefix(params.prefix))
    , chunk_size_(params.chunk_size)
    , bulk_delete_(store_->capabilities().bulk_delete) {

    // The chunk size floor belongs to DriverParameters::validate()
    if (container_.empty()) {
        throw std::runtime_error("Invalid driver parameters: container is required");
    }
    if (chunk_size_ == 0) {
        throw std::runtime_error("Invalid driver parameters: chunk size must be > 0");
    }

    for (const auto& c : {container_, segments_container_}) {
        auto result = store_->create_container(c);
        if (!result.success) {
            throw std::runtime_error("Failed to create container " + c + ": " +
                                     result.error_message);
        }
    }
}

std::unique_ptr<SwiftDriver> SwiftDriver::create(const DriverParameters& params,
                                                 DriverMetrics* metrics) {
    auto err = params.validate();
    if (!err.empty()) {
        throw std::runtime_error("Invalid driver parameters: " + err);
    }
    auto store = ObjectStoreFactory::create("swift", params.store_params());
    return std::make_unique<SwiftDriver>(std::move(store), params, metrics);
}

std::string SwiftDriver::name() const {
    return constants::DRIVER_NAME;
}

std::string SwiftDriver::store_name(const std::string& path) const {
    return normalize_prefix(prefix_ + path);
}

std::string SwiftDriver::logical_path(const std::string& store_name) const {
    std::string rest = store_name;
    if (!prefix_.empty() && rest.compare(0, prefix_.size() + 1, prefix_ + "/") == 0) {
        rest = rest.substr(prefix_.size() + 1);
    }
    return "/" + rest;
}

void SwiftDriver::finish(const char* operation, const DriverError& error) {
    if (metrics_) {
        metrics_->record_operation(operation, error.ok());
    }
    if (!error.ok() && verbose_) {
        log_info("%s failed: %s", operation, error.to_string().c_str());
    }
}

// ============================================================================
// Whole-object operations
// ============================================================================

ContentResult SwiftDriver::get_content(const std::string& path) {
    ContentResult result;
    if (!is_valid_path(path)) {
        result.error = DriverError::invalid_path(path);
        finish("get_content", result.error);
        return result;
    }

    auto got = store_->get(container_, store_name(path));
    if (!got.success) {
        result.error = translate_store_error(path, got);
    } else {
        result.data = std::move(got.data);
        if (metrics_) metrics_->bytes_read().Increment(static_cast<double>(result.data.size()));
    }
    finish("get_content", result.error);
    return result;
}

DriverError SwiftDriver::put_content(const std::string& path,
                                     const std::vector<uint8_t>& content) {
    if (!is_valid_path(path)) {
        auto error = DriverError::invalid_path(path);
        finish("put_content", error);
        return error;
    }

    auto name = store_name(path);
    auto error = create_parent_dirs(path);

    // A manifest being replaced by a plain object leaves its segments behind
    std::optional<ManifestRef> replaced;
    if (error.ok()) {
        auto head = store_->head(container_, name);
        if (head.success) {
            replaced = head.metadata.manifest;
        } else if (!head.not_found()) {
            error = translate_store_error(path, head);
        }
    }

    if (error.ok()) {
        PutOptions options;
        options.content_type = constants::DEFAULT_CONTENT_TYPE;
        auto put = store_->put(container_, name, content, options);
        error = translate_store_error(path, put);
    }
    if (error.ok() && metrics_) {
        metrics_->bytes_written().Increment(static_cast<double>(content.size()));
    }
    if (error.ok() && replaced) {
        error = collect_segments(path, *replaced);
    }

    finish("put_content", error);
    return error;
}

ReadStreamResult SwiftDriver::read_stream(const std::string& path, uint64_t offset) {
    ReadStreamResult result;
    if (!is_valid_path(path)) {
        result.error = DriverError::invalid_path(path);
        finish("read_stream", result.error);
        return result;
    }

    GetOptions options;
    options.range_start = offset;
    auto got = store_->get(container_, store_name(path), options);

    if (got.success) {
        if (metrics_) metrics_->bytes_read().Increment(static_cast<double>(got.data.size()));
        result.stream = std::make_unique<std::istringstream>(
            std::string(got.data.begin(), got.data.end()));
    } else if (got.status_code == 416) {
        // Offset at or past the end of the object
        result.stream = std::make_unique<std::istringstream>(std::string{});
    } else {
        result.error = translate_store_error(path, got);
    }
    finish("read_stream", result.error);
    return result;
}

StatResult SwiftDriver::stat(const std::string& path) {
    StatResult result;
    if (!is_valid_path(path)) {
        result.error = DriverError::invalid_path(path);
        finish("stat", result.error);
        return result;
    }

    auto head = store_->head(container_, store_name(path));
    if (!head.success) {
        result.error = translate_store_error(path, head);
    } else {
        result.info.path = path;
        result.info.size = head.metadata.size;
        result.info.is_dir = head.metadata.content_type == constants::DIRECTORY_CONTENT_TYPE;
        result.info.mod_time = head.metadata.last_modified;
    }
    finish("stat", result.error);
    return result;
}

ListPathsResult SwiftDriver::list(const std::string& path) {
    ListPathsResult result;
    if (path != "/" && !is_valid_path(path)) {
        result.error = DriverError::invalid_path(path);
        finish("list", result.error);
        return result;
    }

    ListOptions options;
    options.prefix = store_name(path);
    if (!options.prefix.empty()) {
        options.prefix += "/";
    }
    options.delimiter = "/";

    auto listing = store_->list(container_, options);
    if (!listing.success) {
        result.error = translate_store_error(path, listing);
    } else {
        // Subdir groupings have no object of their own; directory markers do
        for (const auto& entry : listing.entries) {
            if (entry.is_subdir) continue;
            std::string name = entry.name;
            while (!name.empty() && name.back() == '/') name.pop_back();
            result.paths.push_back(logical_path(name));
        }
        std::sort(result.paths.begin(), result.paths.end());
    }
    finish("list", result.error);
    return result;
}

DriverError SwiftDriver::move(const std::string& source, const std::string& dest) {
    if (!is_valid_path(source) || !is_valid_path(dest)) {
        auto error = DriverError::invalid_path(is_valid_path(source) ? dest : source);
        finish("move", error);
        return error;
    }

    auto source_name = store_name(source);
    auto dest_name = store_name(dest);
    if (source_name == dest_name) {
        auto head = store_->head(container_, source_name);
        auto error = translate_store_error(source, head);
        finish("move", error);
        return error;
    }

    auto error = [&]() -> DriverError {
        auto source_head = store_->head(container_, source_name);
        if (!source_head.success) {
            return translate_store_error(source, source_head);
        }

        std::optional<ManifestRef> overwritten;
        auto dest_head = store_->head(container_, dest_name);
        if (dest_head.success) {
            overwritten = dest_head.metadata.manifest;
        } else if (!dest_head.not_found()) {
            return translate_store_error(dest, dest_head);
        }

        auto err = create_parent_dirs(dest);
        if (!err.ok()) return err;

        // Copying a manifest materializes its content at the destination
        auto copied = store_->copy(container_, source_name, container_, dest_name);
        if (!copied.success) {
            return translate_store_error(source, copied);
        }

        auto removed = store_->remove(container_, source_name);
        if (!removed.success) {
            return translate_store_error(source, removed);
        }

        if (source_head.metadata.manifest) {
            err = collect_segments(source, *source_head.metadata.manifest);
            if (!err.ok()) return err;
        }
        if (overwritten) {
            err = collect_segments(dest, *overwritten);
            if (!err.ok()) return err;
        }
        return {};
    }();

    finish("move", error);
    return error;
}

UrlResult SwiftDriver::url_for(const std::string& path) {
    UrlResult result;
    result.error = DriverError::unsupported(path, "url_for is not supported by the swift driver");
    finish("url_for", result.error);
    return result;
}

// ============================================================================
// Segmented write
// ============================================================================

WriteResult SwiftDriver::write_stream(const std::string& path, uint64_t offset,
                                      std::istream& reader) {
    WriteResult result;
    if (!is_valid_path(path)) {
        result.error = DriverError::invalid_path(path);
        finish("write_stream", result.error);
        return result;
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->operation_duration("write_stream"));

    auto name = store_name(path);
    auto segment_prefix = segment_prefix_for(name);

    result.error = [&]() -> DriverError {
        auto err = ensure_manifest(path, name);
        if (!err.ok()) return err;

        std::vector<uint64_t> sizes;
        err = segment_sizes(path, segment_prefix, sizes);
        if (!err.ok()) return err;

        uint64_t length = 0;
        for (auto s : sizes) length += s;

        auto plan = plan_write(offset, length, chunk_size_, sizes);
        if (verbose_) {
            log_info("write %s offset=%lu length=%lu: segment %lu, %lu padding",
                     path.c_str(), static_cast<unsigned long>(offset),
                     static_cast<unsigned long>(length),
                     static_cast<unsigned long>(plan.data_sequence),
                     static_cast<unsigned long>(plan.padding_segments));
        }

        err = write_padding_segments(path, segment_prefix, plan, sizes);
        if (!err.ok()) return err;

        auto old_size = [&sizes](uint64_t sequence) -> uint64_t {
            return sequence <= sizes.size() ? sizes[sequence - 1] : 0;
        };

        uint64_t sequence = plan.data_sequence;
        std::vector<uint8_t> chunk;

        // Bytes of the first data segment before offset: old content, then
        // zeros where offset lies past the end of data
        uint64_t prefix = plan.prefix_length(offset);
        uint64_t kept = std::min(prefix, old_size(sequence));
        if (kept > 0) {
            err = read_segment_range(path, segment_name(segment_prefix, sequence), 0, kept, chunk);
            if (!err.ok()) return err;
        }
        chunk.resize(prefix, 0);

        while (true) {
            size_t head = chunk.size();
            size_t want = chunk_size_ - head;
            chunk.resize(chunk_size_);
            reader.read(reinterpret_cast<char*>(chunk.data() + head),
                        static_cast<std::streamsize>(want));
            if (reader.bad()) {
                return reader_failure(path);
            }
            auto got = static_cast<size_t>(reader.gcount());
            chunk.resize(head + got);

            if (got == 0) {
                // Zeros past the end of data still extend the object to offset
                if (chunk.size() > old_size(sequence)) {
                    err = put_segment(path, segment_name(segment_prefix, sequence), chunk);
                    if (!err.ok()) return err;
                    if (metrics_) metrics_->segments_written().Increment();
                }
                break;
            }

            auto segment = segment_name(segment_prefix, sequence);

            // Keep old bytes past the end of the new data (read before overwrite)
            uint64_t old_len = old_size(sequence);
            if (chunk.size() < old_len) {
                std::vector<uint8_t> tail;
                err = read_segment_range(path, segment, chunk.size(), old_len, tail);
                if (!err.ok()) return err;
                chunk.insert(chunk.end(), tail.begin(), tail.end());
                if (metrics_) metrics_->tail_reads().Increment();
            }

            err = put_segment(path, segment, chunk);
            if (!err.ok()) return err;
            result.bytes_written += got;
            if (metrics_) {
                metrics_->segments_written().Increment();
                metrics_->bytes_written().Increment(static_cast<double>(got));
            }

            if (got < want) {
                break;
            }
            ++sequence;
            chunk.clear();
        }
        return {};
    }();

    if (!result.error.ok()) {
        log_error("write %s at offset %lu failed after %lu bytes: %s",
                  path.c_str(), static_cast<unsigned long>(offset),
                  static_cast<unsigned long>(result.bytes_written),
                  result.error.to_string().c_str());
    }
    finish("write_stream", result.error);
    return result;
}

DriverError SwiftDriver::ensure_manifest(const std::string& path, const std::string& name) {
    auto segment_prefix = segment_prefix_for(name);

    auto head = store_->head(container_, name);
    if (head.success && head.metadata.manifest) {
        return {};
    }
    if (!head.success && !head.not_found()) {
        return translate_store_error(path, head);
    }

    // Plain object: its content becomes the leading segments
    std::vector<uint8_t> adopted;
    if (head.success) {
        auto got = store_->get(container_, name);
        if (!got.success) {
            return translate_store_error(path, got);
        }
        adopted = std::move(got.data);
    } else {
        auto err = create_parent_dirs(path);
        if (!err.ok()) return err;
    }

    // Segments left by an earlier object at this path would be concatenated
    // into this one
    ManifestRef manifest{segments_container_, segment_prefix};
    auto err = collect_segments(path, manifest);
    if (!err.ok()) return err;

    uint64_t sequence = 1;
    for (size_t pos = 0; pos < adopted.size(); pos += chunk_size_, ++sequence) {
        size_t end = std::min<size_t>(pos + chunk_size_, adopted.size());
        std::vector<uint8_t> part(adopted.begin() + static_cast<std::ptrdiff_t>(pos),
                                  adopted.begin() + static_cast<std::ptrdiff_t>(end));
        err = put_segment(path, segment_name(segment_prefix, sequence), part);
        if (!err.ok()) return err;
    }

    PutOptions options;
    // An adopted directory marker holds data from now on
    options.content_type = constants::DEFAULT_CONTENT_TYPE;
    if (head.success && !head.metadata.content_type.empty() &&
        head.metadata.content_type != constants::DIRECTORY_CONTENT_TYPE) {
        options.content_type = head.metadata.content_type;
    }
    options.manifest = manifest;
    auto put = store_->put(container_, name, {}, options);
    if (!put.success) {
        return translate_store_error(path, put);
    }

    if (verbose_) {
        log_info("Created manifest %s/%s -> %s (%zu bytes adopted)",
                 container_.c_str(), name.c_str(), manifest.to_header().c_str(), adopted.size());
    }
    return {};
}

DriverError SwiftDriver::create_parent_dirs(const std::string& path) {
    for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        auto dir = path.substr(0, pos);
        auto name = store_name(dir);

        auto head = store_->head(container_, name);
        if (head.success) continue;
        if (!head.not_found()) {
            return translate_store_error(dir, head);
        }

        PutOptions options;
        options.content_type = constants::DIRECTORY_CONTENT_TYPE;
        auto put = store_->put(container_, name, {}, options);
        if (!put.success) {
            return translate_store_error(dir, put);
        }
    }
    return {};
}

DriverError SwiftDriver::segment_sizes(const std::string& path,
                                       const std::string& segment_prefix,
                                       std::vector<uint64_t>& sizes) {
    ListOptions options;
    options.prefix = segment_prefix;
    auto listing = store_->list(segments_container_, options);
    if (!listing.success) {
        return translate_store_error(path, listing);
    }

    std::map<uint64_t, uint64_t> by_sequence;
    for (const auto& entry : listing.entries) {
        if (auto sequence = parse_segment_sequence(segment_prefix, entry.name)) {
            by_sequence[*sequence] = entry.size;
        }
    }

    sizes.clear();
    for (const auto& [sequence, size] : by_sequence) {
        if (sequence != sizes.size() + 1) break;
        sizes.push_back(size);
    }
    return {};
}

DriverError SwiftDriver::write_padding_segments(const std::string& path,
                                                const std::string& segment_prefix,
                                                const SegmentPlan& plan,
                                                const std::vector<uint64_t>& sizes) {
    for (uint64_t i = 0; i < plan.padding_segments; ++i) {
        uint64_t sequence = plan.first_sequence + i;
        auto segment = segment_name(segment_prefix, sequence);

        std::vector<uint8_t> data;
        uint64_t old_len = sequence <= sizes.size() ? sizes[sequence - 1] : 0;
        if (old_len > 0) {
            auto err = read_segment_range(path, segment, 0, old_len, data);
            if (!err.ok()) return err;
        }
        data.resize(chunk_size_, 0);

        auto err = put_segment(path, segment, data);
        if (!err.ok()) return err;
        if (metrics_) metrics_->padding_segments().Increment();
    }
    return {};
}

DriverError SwiftDriver::read_segment_range(const std::string& path, const std::string& segment,
                                            uint64_t start, uint64_t end,
                                            std::vector<uint8_t>& out) {
    GetOptions options;
    options.range_start = start;
    options.range_end = end;
    auto got = store_->get(segments_container_, segment, options);
    if (!got.success) {
        return translate_store_error(path, got);
    }
    if (got.data.size() != end - start) {
        return {DriverErrorCode::Remote, path, got.status_code,
                "short read of segment " + segment + ": expected " +
                std::to_string(end - start) + " bytes, got " + std::to_string(got.data.size())};
    }
    out.insert(out.end(), got.data.begin(), got.data.end());
    return {};
}

DriverError SwiftDriver::put_segment(const std::string& path, const std::string& segment,
                                     const std::vector<uint8_t>& data) {
    PutOptions options;
    options.content_type = constants::DEFAULT_CONTENT_TYPE;
    auto put = store_->put(segments_container_, segment, data, options);
    return translate_store_error(path, put);
}

// ============================================================================
// Recursive delete
// ============================================================================

DriverError SwiftDriver::remove(const std::string& path) {
    if (!is_valid_path(path)) {
        auto error = DriverError::invalid_path(path);
        finish("remove", error);
        return error;
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->operation_duration("remove"));

    auto name = store_name(path);
    auto error = [&]() -> DriverError {
        std::vector<std::string> names;
        auto err = enumerate_subtree(path, name, names);
        if (!err.ok()) return err;
        if (names.empty()) {
            return DriverError::path_not_found(path);
        }

        if (bulk_delete_) {
            err = bulk_remove(path, name, names);
            if (err.ok()) return err;
            log_error("Bulk delete of %s failed, deleting objects one by one: %s",
                      path.c_str(), err.to_string().c_str());
            err = remove_each(path, names);
            if (!err.ok()) return err;
            // Manifests the failed bulk call already removed left their segments
            return remove_segment_tree(path, name);
        }
        return remove_each(path, names);
    }();

    finish("remove", error);
    return error;
}

DriverError SwiftDriver::enumerate_subtree(const std::string& path, const std::string& name,
                                           std::vector<std::string>& names) {
    ListOptions options;
    options.prefix = name;
    auto listing = store_->list(container_, options);
    if (!listing.success) {
        return translate_store_error(path, listing);
    }

    // "a" must not match "ab"
    auto below = name + "/";
    for (const auto& entry : listing.entries) {
        if (entry.is_subdir) continue;
        if (entry.name == name || entry.name.starts_with(below)) {
            names.push_back(entry.name);
        }
    }
    return {};
}

DriverError SwiftDriver::bulk_remove(const std::string& path, const std::string& name,
                                     const std::vector<std::string>& names) {
    std::vector<ObjectPath> objects;
    for (const auto& n : names) {
        objects.push_back({container_, n});
    }

    // Segments of the path and of every object below it share this prefix
    ListOptions options;
    options.prefix = segment_prefix_for(name);
    auto segments = store_->list(segments_container_, options);
    if (!segments.success) {
        return translate_store_error(path, segments);
    }
    for (const auto& entry : segments.entries) {
        if (!entry.is_subdir) objects.push_back({segments_container_, entry.name});
    }

    for (size_t pos = 0; pos < objects.size(); pos += constants::BULK_DELETE_MAX_OBJECTS) {
        size_t end = std::min(pos + constants::BULK_DELETE_MAX_OBJECTS, objects.size());
        std::vector<ObjectPath> batch(objects.begin() + static_cast<std::ptrdiff_t>(pos),
                                      objects.begin() + static_cast<std::ptrdiff_t>(end));
        auto result = store_->bulk_delete(batch);
        if (!result.success) {
            return {DriverErrorCode::Remote, path, result.status_code, result.error_message};
        }
        if (metrics_) {
            metrics_->bulk_deletes().Increment();
            metrics_->objects_deleted().Increment(static_cast<double>(result.deleted));
        }
    }

    if (verbose_) {
        log_info("Bulk deleted %s: %zu objects, %zu segments",
                 path.c_str(), names.size(), objects.size() - names.size());
    }
    return {};
}

DriverError SwiftDriver::remove_each(const std::string& path,
                                     const std::vector<std::string>& names) {
    for (const auto& n : names) {
        auto object_path = logical_path(n);

        // Objects already gone (e.g. removed by a failed bulk call) are skipped
        auto head = store_->head(container_, n);
        if (head.not_found()) continue;
        if (!head.success) {
            return translate_store_error(object_path, head);
        }

        if (head.metadata.manifest) {
            auto err = collect_segments(object_path, *head.metadata.manifest);
            if (!err.ok()) return err;
        }

        auto removed = store_->remove(container_, n);
        if (!removed.success && !removed.not_found()) {
            return translate_store_error(object_path, removed);
        }
        if (metrics_) metrics_->objects_deleted().Increment();
    }

    if (verbose_) {
        log_info("Deleted %s: %zu objects", path.c_str(), names.size());
    }
    return {};
}

DriverError SwiftDriver::remove_segment_tree(const std::string& path, const std::string& name) {
    ListOptions options;
    options.prefix = segment_prefix_for(name);
    auto listing = store_->list(segments_container_, options);
    if (!listing.success) {
        return translate_store_error(path, listing);
    }
    for (const auto& entry : listing.entries) {
        if (entry.is_subdir) continue;
        auto removed = store_->remove(segments_container_, entry.name);
        if (!removed.success && !removed.not_found()) {
            return translate_store_error(path, removed);
        }
    }
    return {};
}

DriverError SwiftDriver::collect_segments(const std::string& path, const ManifestRef& manifest) {
    // An empty prefix would select the whole container
    if (manifest.container.empty() || manifest.prefix.empty()) {
        log_error("Ignoring manifest of %s with empty segment prefix: %s",
                  path.c_str(), manifest.to_header().c_str());
        return {};
    }

    ListOptions options;
    options.prefix = manifest.prefix;
    auto listing = store_->list(manifest.container, options);
    if (listing.not_found()) {
        return {};
    }
    if (!listing.success) {
        return translate_store_error(path, listing);
    }

    // In our own segments container "a/" also holds the segments of "a/b";
    // only the numbered segments directly under the prefix belong to this object
    bool own = manifest.container == segments_container_;
    for (const auto& entry : listing.entries) {
        if (entry.is_subdir) continue;
        if (own && !parse_segment_sequence(manifest.prefix, entry.name)) continue;
        auto removed = store_->remove(manifest.container, entry.name);
        if (!removed.success && !removed.not_found()) {
            return translate_store_error(path, removed);
        }
    }
    return {};
}

}  // namespace swiftfs
