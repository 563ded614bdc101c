#include "swiftfs/storage/object_store.hpp"
#include "swiftfs/core/constants.hpp"
#include "swiftfs/net/http.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <set>

namespace swiftfs {

// ============================================================================
// LocalObjectStore - File system implementation of Swift semantics
// ============================================================================
//
// Layout: <root>/<container>/<encoded name>.data holds the body and
// <encoded name>.meta holds a JSON document with content type and manifest.
// Names are percent-encoded (including '/') so "a" and "a/b" can coexist.
// Manifest objects are resolved on read exactly like Swift dynamic large
// objects: the body is the concatenation of every object under the
// referenced prefix, in name order.

class LocalObjectStore : public ObjectStore {
public:
    LocalObjectStore(const std::filesystem::path& root, bool bulk_delete)
        : root_(std::filesystem::absolute(root)) {
        std::filesystem::create_directories(root_);
        capabilities_.bulk_delete = bulk_delete;
    }

    std::string type_name() const override { return "local"; }

    StoreResult create_container(const std::string& container) override {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        std::filesystem::create_directories(root_ / container, ec);
        if (ec) {
            return {false, 500, "Failed to create container " + container + ": " + ec.message()};
        }
        return {true, 201, ""};
    }

    HeadResult head(const std::string& container,
                    const std::string& name) const override {
        std::lock_guard lock(mutex_);
        HeadResult result;
        auto meta = load_metadata(container, name);
        if (!meta) {
            result.status_code = 404;
            result.error_message = "Object not found: " + container + "/" + name;
            return result;
        }
        result.success = true;
        result.status_code = 200;
        result.metadata = std::move(*meta);
        return result;
    }

    GetResult get(const std::string& container,
                  const std::string& name,
                  const GetOptions& options) const override {
        std::lock_guard lock(mutex_);
        GetResult result;

        auto meta = load_metadata(container, name);
        if (!meta) {
            result.status_code = 404;
            result.error_message = "Object not found: " + container + "/" + name;
            return result;
        }

        std::vector<uint8_t> body;
        if (meta->manifest) {
            for (const auto& segment : list_names(meta->manifest->container, meta->manifest->prefix)) {
                auto part = read_body(meta->manifest->container, segment);
                body.insert(body.end(), part.begin(), part.end());
            }
        } else {
            body = read_body(container, name);
        }

        uint64_t size = body.size();
        if (options.range_start || options.range_end) {
            uint64_t start = options.range_start.value_or(0);
            uint64_t end = std::min(options.range_end.value_or(size), size);
            if (start >= size) {
                result.status_code = 416;
                result.error_message = "Requested range not satisfiable";
                return result;
            }
            if (end <= start) {
                body.clear();
            } else {
                body = std::vector<uint8_t>(body.begin() + static_cast<std::ptrdiff_t>(start),
                                            body.begin() + static_cast<std::ptrdiff_t>(end));
            }
            result.status_code = 206;
        } else {
            result.status_code = 200;
        }

        result.success = true;
        result.metadata = std::move(*meta);
        result.data = std::move(body);
        return result;
    }

    PutResult put(const std::string& container,
                  const std::string& name,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        std::lock_guard lock(mutex_);
        PutResult result;

        auto dir = root_ / container;
        if (!std::filesystem::is_directory(dir)) {
            result.status_code = 404;
            result.error_message = "Container not found: " + container;
            return result;
        }

        // Write to temp file then rename (atomic)
        auto data_path = data_file(container, name);
        auto temp_path = data_path.string() + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                result.status_code = 500;
                result.error_message = "Failed to create file";
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                std::filesystem::remove(temp_path);
                result.status_code = 500;
                result.error_message = "Failed to write data";
                return result;
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, data_path, ec);
        if (ec) {
            std::filesystem::remove(temp_path);
            result.status_code = 500;
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        nlohmann::json meta;
        meta["content_type"] = options.content_type.empty()
            ? std::string(constants::DEFAULT_CONTENT_TYPE) : options.content_type;
        if (options.manifest) {
            meta["manifest"] = options.manifest->to_header();
        }
        meta["metadata"] = options.metadata;

        std::ofstream meta_file(meta_path(container, name), std::ios::trunc);
        meta_file << meta.dump();
        if (!meta_file) {
            result.status_code = 500;
            result.error_message = "Failed to write metadata";
            return result;
        }

        result.success = true;
        result.status_code = 201;
        return result;
    }

    StoreResult remove(const std::string& container,
                       const std::string& name) override {
        std::lock_guard lock(mutex_);
        return remove_locked(container, name);
    }

    BulkDeleteResult bulk_delete(const std::vector<ObjectPath>& objects) override {
        std::lock_guard lock(mutex_);
        BulkDeleteResult result;
        if (!capabilities_.bulk_delete) {
            result.status_code = 501;
            result.error_message = "Bulk delete not supported";
            return result;
        }

        for (const auto& obj : objects) {
            auto r = remove_locked(obj.container, obj.name);
            if (r.success) {
                ++result.deleted;
            } else if (r.not_found()) {
                ++result.missing;
            } else {
                result.errors.push_back("/" + obj.container + "/" + obj.name + ": " + r.error_message);
            }
        }

        result.success = result.errors.empty();
        result.status_code = result.success ? 200 : 500;
        if (!result.success) {
            result.error_message = "Bulk delete failed: " + result.errors.front();
        }
        return result;
    }

    ListResult list(const std::string& container,
                    const ListOptions& options) const override {
        std::lock_guard lock(mutex_);
        ListResult result;

        if (!std::filesystem::is_directory(root_ / container)) {
            result.status_code = 404;
            result.error_message = "Container not found: " + container;
            return result;
        }

        std::set<std::string> subdirs;
        for (const auto& name : list_names(container, options.prefix)) {
            if (!options.delimiter.empty()) {
                auto pos = name.find(options.delimiter, options.prefix.size());
                if (pos != std::string::npos) {
                    std::string subdir = name.substr(0, pos + options.delimiter.size());
                    if (subdirs.insert(subdir).second) {
                        ListEntry entry;
                        entry.name = subdir;
                        entry.is_subdir = true;
                        result.entries.push_back(std::move(entry));
                    }
                    continue;
                }
            }

            auto meta = load_metadata(container, name);
            if (!meta) continue;

            ListEntry entry;
            entry.name = name;
            // Listings report stored bytes, not the resolved manifest size
            entry.size = stored_size(container, name);
            entry.content_type = meta->content_type;
            entry.last_modified = meta->last_modified;
            result.entries.push_back(std::move(entry));
        }

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.name < b.name; });

        result.success = true;
        result.status_code = 200;
        return result;
    }

    StoreResult copy(const std::string& source_container,
                     const std::string& source_name,
                     const std::string& dest_container,
                     const std::string& dest_name) override {
        auto source = get(source_container, source_name, {});
        if (!source.success) {
            return {false, source.status_code, source.error_message};
        }

        PutOptions options;
        options.content_type = source.metadata.content_type;
        options.metadata = source.metadata.user_metadata;
        auto put_result = put(dest_container, dest_name, source.data, options);
        return {put_result.success, put_result.status_code, put_result.error_message};
    }

    StoreCapabilities capabilities() const override { return capabilities_; }

private:
    std::filesystem::path root_;
    StoreCapabilities capabilities_;
    mutable std::mutex mutex_;

    std::filesystem::path data_file(const std::string& container, const std::string& name) const {
        return root_ / container / (net::url_encode(name) + ".data");
    }

    std::filesystem::path meta_path(const std::string& container, const std::string& name) const {
        return root_ / container / (net::url_encode(name) + ".meta");
    }

    uint64_t stored_size(const std::string& container, const std::string& name) const {
        std::error_code ec;
        auto size = std::filesystem::file_size(data_file(container, name), ec);
        return ec ? 0 : size;
    }

    std::vector<uint8_t> read_body(const std::string& container, const std::string& name) const {
        std::ifstream file(data_file(container, name), std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    }

    // Sorted names in a container starting with prefix
    std::vector<std::string> list_names(const std::string& container,
                                        const std::string& prefix) const {
        std::vector<std::string> names;
        auto dir = root_ / container;
        if (!std::filesystem::is_directory(dir)) {
            return names;
        }

        static const std::string suffix = ".data";
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            auto file = entry.path().filename().string();
            if (!entry.is_regular_file() || !file.ends_with(suffix)) continue;
            auto name = net::url_decode(file.substr(0, file.size() - suffix.size()));
            if (name.compare(0, prefix.size(), prefix) == 0) {
                names.push_back(std::move(name));
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::optional<ObjectMetadata> load_metadata(const std::string& container,
                                                const std::string& name) const {
        auto path = data_file(container, name);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.content_type = constants::DEFAULT_CONTENT_TYPE;
        meta.size = stored_size(container, name);
        auto ftime = std::filesystem::last_write_time(path, ec);
        if (!ec) {
            meta.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }

        std::ifstream meta_file(meta_path(container, name));
        if (meta_file) {
            try {
                auto j = nlohmann::json::parse(meta_file);
                meta.content_type = j.value("content_type", meta.content_type);
                if (j.contains("manifest")) {
                    meta.manifest = ManifestRef::parse(j["manifest"].get<std::string>());
                }
                if (j.contains("metadata") && j["metadata"].is_object()) {
                    meta.user_metadata = j["metadata"].get<std::map<std::string, std::string>>();
                }
            } catch (const std::exception& e) {
                std::cerr << "[swiftfs] corrupt metadata for " << container << "/" << name
                          << ": " << e.what() << "\n";
            }
        }

        if (meta.manifest) {
            meta.size = 0;
            for (const auto& segment : list_names(meta.manifest->container, meta.manifest->prefix)) {
                meta.size += stored_size(meta.manifest->container, segment);
            }
        }
        return meta;
    }

    StoreResult remove_locked(const std::string& container, const std::string& name) {
        auto path = data_file(container, name);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return {false, 404, "Object not found: " + container + "/" + name};
        }
        std::filesystem::remove(path, ec);
        if (ec) {
            return {false, 500, "Failed to remove " + container + "/" + name + ": " + ec.message()};
        }
        std::filesystem::remove(meta_path(container, name), ec);
        return {true, 204, ""};
    }
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(
    const std::filesystem::path& root_path, bool bulk_delete) {
    return std::make_unique<LocalObjectStore>(root_path, bulk_delete);
}

} // namespace swiftfs
