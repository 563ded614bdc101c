#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "swiftfs/core/constants.hpp"

namespace swiftfs {

/// Parameters of a Swift-backed driver.
struct DriverParameters {
    // Credentials and Keystone scope
    std::string username;
    std::string password;
    std::string auth_url;
    std::string tenant;
    std::string tenant_id;
    std::string domain;
    std::string domain_id;
    std::string region;

    std::string container;
    std::string prefix;            // Prepended to every store name
    bool insecure_skip_verify = false;
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;

    /// Overlay values from a string parameter map (keys as accepted by the
    /// driver factory: "username", "authurl", "chunksize", ...).
    /// Returns error message or empty string on success.
    std::string apply_map(const std::map<std::string, std::string>& params);

    /// Parameters for ObjectStoreFactory::create("swift", ...)
    std::map<std::string, std::string> store_params() const;

    /// Validate required fields. Credentials are only checked when the
    /// driver talks to Swift. Returns error message or empty string.
    std::string validate(bool require_credentials = true) const;
};

/// Configuration for the swiftfs command line tool.
struct CliConfig {
    DriverParameters driver;

    std::string backend = "swift";           // "swift" or "local"
    std::filesystem::path local_root;        // Root directory of the local store
    bool local_bulk_delete = false;

    bool verbose = false;
    std::filesystem::path metrics_file;      // Prometheus textfile, written on exit

    std::string command;
    std::vector<std::string> args;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<CliConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill missing credentials from the OpenStack environment variables.
    void apply_environment();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace swiftfs
