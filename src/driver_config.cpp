#include "swiftfs/driver_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace swiftfs {

// --- DriverParameters ---

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

// Keys accepted in parameter maps and JSON config files
const char* const DRIVER_KEYS[] = {
    "username", "password", "authurl", "tenant", "tenantid", "domain",
    "domainid", "region", "container", "prefix", "insecureskipverify", "chunksize",
};

}  // namespace

std::string DriverParameters::apply_map(const std::map<std::string, std::string>& params) {
    for (const auto& [key, value] : params) {
        if (key == "username") {
            username = value;
        } else if (key == "password") {
            password = value;
        } else if (key == "authurl") {
            auth_url = value;
        } else if (key == "tenant") {
            tenant = value;
        } else if (key == "tenantid") {
            tenant_id = value;
        } else if (key == "domain") {
            domain = value;
        } else if (key == "domainid") {
            domain_id = value;
        } else if (key == "region") {
            region = value;
        } else if (key == "container") {
            container = value;
        } else if (key == "prefix") {
            prefix = value;
        } else if (key == "insecureskipverify") {
            insecure_skip_verify = parse_bool(value);
        } else if (key == "chunksize") {
            try {
                size_t pos = 0;
                chunk_size = std::stoull(value, &pos);
                if (pos != value.size()) return "chunksize must be an integer: " + value;
            } catch (const std::exception&) {
                return "chunksize must be an integer: " + value;
            }
        } else {
            return "unknown parameter: " + key;
        }
    }
    return {};
}

std::map<std::string, std::string> DriverParameters::store_params() const {
    return {
        {"username", username},
        {"password", password},
        {"authurl", auth_url},
        {"tenant", tenant},
        {"tenantid", tenant_id},
        {"domain", domain},
        {"domainid", domain_id},
        {"region", region},
        {"insecureskipverify", insecure_skip_verify ? "true" : "false"},
    };
}

std::string DriverParameters::validate(bool require_credentials) const {
    if (require_credentials) {
        if (username.empty()) return "username is required";
        if (password.empty()) return "password is required";
        if (auth_url.empty()) return "authurl is required";
    }
    if (container.empty()) return "container is required";
    if (chunk_size < constants::MIN_CHUNK_SIZE) {
        return "chunksize must be at least " + std::to_string(constants::MIN_CHUNK_SIZE) +
               " (got " + std::to_string(chunk_size) + ")";
    }
    return {};
}

// --- CliConfig ---

std::optional<CliConfig> CliConfig::from_args(int argc, char* argv[]) {
    CliConfig config;
    std::map<std::string, std::string> params;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--username" || arg == "--password" || arg == "--authurl" ||
            arg == "--tenant" || arg == "--tenantid" || arg == "--domain" ||
            arg == "--domainid" || arg == "--region" || arg == "--container" ||
            arg == "--prefix" || arg == "--chunksize") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            params[arg.substr(2)] = v;
        } else if (arg == "--insecure-skip-verify") {
            params["insecureskipverify"] = "true";
        } else if (arg == "--backend") {
            auto* v = next_arg(i, "--backend");
            if (!v) return std::nullopt;
            config.backend = v;
        } else if (arg == "--local-root") {
            auto* v = next_arg(i, "--local-root");
            if (!v) return std::nullopt;
            config.local_root = v;
            config.backend = "local";
        } else if (arg == "--local-bulk-delete") {
            config.local_bulk_delete = true;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr <<
                "Usage: swiftfs [options] <command> [args]\n"
                "\n"
                "Commands:\n"
                "  get <path>                       Print object content\n"
                "  put <path> <file|->              Store a file as a single object\n"
                "  cat <path> [offset]              Print content starting at offset\n"
                "  write <path> <offset>            Write stdin at offset (segmented)\n"
                "  stat <path>                      Show size, type and modification time\n"
                "  ls [path]                        List immediate children\n"
                "  mv <source> <dest>               Move an object\n"
                "  rm <path>                        Recursively delete a path\n"
                "  info                             Show driver settings and capabilities\n"
                "\n"
                "Swift options:\n"
                "  --authurl <url>                  Keystone / tempauth URL (or OS_AUTH_URL env)\n"
                "  --username <name>                User name (or OS_USERNAME env)\n"
                "  --password <secret>              Password (or OS_PASSWORD env)\n"
                "  --tenant <name>                  Tenant / project name\n"
                "  --tenantid <id>                  Tenant / project ID\n"
                "  --domain <name>                  Keystone v3 domain name\n"
                "  --domainid <id>                  Keystone v3 domain ID\n"
                "  --region <name>                  Region in the service catalog\n"
                "  --insecure-skip-verify           Skip TLS certificate verification\n"
                "\n"
                "Driver options:\n"
                "  --container <name>               Container holding the objects\n"
                "  --prefix <path>                  Prefix for every object name\n"
                "  --chunksize <bytes>              Segment size (default: 20MB, min: 1MB)\n"
                "\n"
                "Other:\n"
                "  --backend <swift|local>          Object store (default: swift)\n"
                "  --local-root <path>              Use a local directory as the object store\n"
                "  --local-bulk-delete              Advertise bulk delete in the local store\n"
                "  --config <path>                  JSON config file\n"
                "  --metrics-file <path>            Prometheus .prom file written on exit\n"
                "  --verbose                        Verbose output\n"
                "  --help                           Show this help\n";
            return std::nullopt;
        } else if (arg.size() > 1 && arg[0] == '-' && config.command.empty()) {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (config.command.empty()) {
            config.command = arg;
        } else {
            config.args.push_back(arg);
        }
    }

    auto err = config.driver.apply_map(params);
    if (!err.empty()) {
        std::cerr << "Error: " << err << "\n";
        return std::nullopt;
    }

    config.apply_environment();
    return config;
}

bool CliConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("backend")) backend = j["backend"].get<std::string>();
        if (j.contains("local_root")) local_root = j["local_root"].get<std::string>();
        if (j.contains("local_bulk_delete")) local_bulk_delete = j["local_bulk_delete"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();

        // Driver parameters may be given as strings, numbers or booleans
        std::map<std::string, std::string> params;
        for (const char* key : DRIVER_KEYS) {
            if (!j.contains(key)) continue;
            const auto& v = j[key];
            params[key] = v.is_string() ? v.get<std::string>() : v.dump();
        }
        auto err = driver.apply_map(params);
        if (!err.empty()) {
            std::cerr << "Error in config file: " << err << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CliConfig::apply_environment() {
    auto fill = [](std::string& field, const char* env) {
        if (!field.empty()) return;
        if (const char* v = std::getenv(env)) field = v;
    };
    fill(driver.username, "OS_USERNAME");
    fill(driver.password, "OS_PASSWORD");
    fill(driver.auth_url, "OS_AUTH_URL");
}

std::string CliConfig::validate() const {
    if (command.empty()) return "command is required (see --help)";
    if (backend == "local") {
        if (local_root.empty()) return "local backend requires --local-root";
    } else if (backend != "swift") {
        return "unknown backend: " + backend;
    }
    return driver.validate(backend == "swift");
}

}  // namespace swiftfs
