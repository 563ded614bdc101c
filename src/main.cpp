#include "swiftfs/driver/swift_driver.hpp"
#include "swiftfs/driver_config.hpp"
#include "swiftfs/metrics.hpp"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>

namespace {

int print_error(const swiftfs::DriverError& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return error.code == swiftfs::DriverErrorCode::PathNotFound ? 2 : 1;
}

bool need_args(const swiftfs::CliConfig& config, size_t min_args, size_t max_args,
               const char* usage) {
    if (config.args.size() < min_args || config.args.size() > max_args) {
        std::cerr << "Usage: swiftfs [options] " << usage << "\n";
        return false;
    }
    return true;
}

bool parse_offset(const std::string& value, uint64_t& offset) {
    try {
        size_t pos = 0;
        offset = std::stoull(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

void print_info(const swiftfs::CliConfig& config, const swiftfs::SwiftDriver& driver) {
    std::cout << "driver: " << driver.name() << std::endl;
    std::cout << "  backend: " << config.backend << std::endl;
    if (config.backend == "local") {
        std::cout << "  local-root: " << config.local_root.string() << std::endl;
    } else {
        std::cout << "  authurl: " << config.driver.auth_url << std::endl;
        std::cout << "  username: " << config.driver.username << std::endl;
        // Mask secrets in log output
        std::cout << "  password: ****" << std::endl;
        if (!config.driver.tenant.empty()) std::cout << "  tenant: " << config.driver.tenant << std::endl;
        if (!config.driver.region.empty()) std::cout << "  region: " << config.driver.region << std::endl;
    }
    std::cout << "  container: " << driver.container() << std::endl;
    std::cout << "  segments-container: " << driver.segments_container() << std::endl;
    std::cout << "  prefix: " << config.driver.prefix << std::endl;
    std::cout << "  chunk-size: " << driver.chunk_size() << std::endl;
    std::cout << "  bulk-delete: " << (driver.bulk_delete_supported() ? "yes" : "no") << std::endl;
}

int run(const swiftfs::CliConfig& config, swiftfs::SwiftDriver& driver) {
    const auto& cmd = config.command;
    const auto& args = config.args;

    if (cmd == "info") {
        if (!need_args(config, 0, 0, "info")) return 1;
        print_info(config, driver);
        return 0;
    }

    if (cmd == "get") {
        if (!need_args(config, 1, 1, "get <path>")) return 1;
        auto result = driver.get_content(args[0]);
        if (!result.error.ok()) return print_error(result.error);
        std::cout.write(reinterpret_cast<const char*>(result.data.data()),
                        static_cast<std::streamsize>(result.data.size()));
        return std::cout.good() ? 0 : 1;
    }

    if (cmd == "put") {
        if (!need_args(config, 2, 2, "put <path> <file|->")) return 1;
        std::vector<uint8_t> data;
        if (args[1] == "-") {
            data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            std::ifstream ifs(args[1], std::ios::binary);
            if (!ifs) {
                std::cerr << "Error: cannot open " << args[1] << "\n";
                return 1;
            }
            data.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        }
        auto error = driver.put_content(args[0], data);
        if (!error.ok()) return print_error(error);
        return 0;
    }

    if (cmd == "cat") {
        if (!need_args(config, 1, 2, "cat <path> [offset]")) return 1;
        uint64_t offset = 0;
        if (args.size() == 2 && !parse_offset(args[1], offset)) {
            std::cerr << "Error: invalid offset: " << args[1] << "\n";
            return 1;
        }
        auto result = driver.read_stream(args[0], offset);
        if (!result.error.ok()) return print_error(result.error);
        std::cout << result.stream->rdbuf();
        return 0;
    }

    if (cmd == "write") {
        if (!need_args(config, 2, 2, "write <path> <offset>")) return 1;
        uint64_t offset = 0;
        if (!parse_offset(args[1], offset)) {
            std::cerr << "Error: invalid offset: " << args[1] << "\n";
            return 1;
        }
        auto result = driver.write_stream(args[0], offset, std::cin);
        std::cout << result.bytes_written << std::endl;
        if (!result.error.ok()) {
            std::cerr << "Resume at offset " << offset + result.bytes_written << "\n";
            return print_error(result.error);
        }
        return 0;
    }

    if (cmd == "stat") {
        if (!need_args(config, 1, 1, "stat <path>")) return 1;
        auto result = driver.stat(args[0]);
        if (!result.error.ok()) return print_error(result.error);
        auto t = std::chrono::system_clock::to_time_t(result.info.mod_time);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        std::cout << "path: " << result.info.path << std::endl;
        std::cout << "size: " << result.info.size << std::endl;
        std::cout << "type: " << (result.info.is_dir ? "directory" : "file") << std::endl;
        std::cout << "modified: " << buf << std::endl;
        return 0;
    }

    if (cmd == "ls") {
        if (!need_args(config, 0, 1, "ls [path]")) return 1;
        auto result = driver.list(args.empty() ? "/" : args[0]);
        if (!result.error.ok()) return print_error(result.error);
        for (const auto& p : result.paths) {
            std::cout << p << "\n";
        }
        return 0;
    }

    if (cmd == "mv") {
        if (!need_args(config, 2, 2, "mv <source> <dest>")) return 1;
        auto error = driver.move(args[0], args[1]);
        if (!error.ok()) return print_error(error);
        return 0;
    }

    if (cmd == "rm") {
        if (!need_args(config, 1, 1, "rm <path>")) return 1;
        auto error = driver.remove(args[0]);
        if (!error.ok()) return print_error(error);
        return 0;
    }

    std::cerr << "Error: unknown command: " << cmd << " (see --help)\n";
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = swiftfs::CliConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    swiftfs::DriverMetrics metrics({{"container", config.driver.container}});

    std::unique_ptr<swiftfs::SwiftDriver> driver;
    try {
        if (config.backend == "local") {
            auto store = swiftfs::ObjectStoreFactory::create_local(config.local_root,
                                                                   config.local_bulk_delete);
            driver = std::make_unique<swiftfs::SwiftDriver>(std::move(store), config.driver, &metrics);
        } else {
            driver = swiftfs::SwiftDriver::create(config.driver, &metrics);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize driver: " << e.what() << "\n";
        return 1;
    }
    driver->set_verbose(config.verbose);

    int rc = run(config, *driver);

    if (!config.metrics_file.empty() && !metrics.write_file(config.metrics_file)) {
        std::cerr << "Warning: failed to write metrics file " << config.metrics_file << "\n";
    }
    return rc;
}
