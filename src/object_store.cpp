#include "swiftfs/storage/object_store.hpp"
#include <stdexcept>

namespace swiftfs {

std::optional<ManifestRef> ManifestRef::parse(const std::string& header) {
    auto slash = header.find('/');
    if (slash == std::string::npos || slash == 0) {
        return std::nullopt;
    }
    ManifestRef ref;
    ref.container = header.substr(0, slash);
    ref.prefix = header.substr(slash + 1);
    return ref;
}

std::string swift_info_url(const std::string& auth_url) {
    std::string url = auth_url;
    while (!url.empty() && url.back() == '/') url.pop_back();

    // Path removal never eats into "scheme://host"
    size_t root_end = 0;
    auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        root_end = url.find('/', scheme + 3);
        if (root_end == std::string::npos) root_end = url.size();
    }

    for (int i = 0; i < 2 && url.size() > root_end; ++i) {
        auto slash = url.rfind('/');
        if (slash == std::string::npos || slash < root_end) {
            url.resize(root_end);
            break;
        }
        url.resize(slash);
    }
    return url + "/info";
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    auto flag = [&params](const char* key) {
        auto it = params.find(key);
        return it != params.end() && (it->second == "true" || it->second == "1");
    };

    if (type == "local") {
        auto it = params.find("path");
        if (it == params.end()) {
            throw std::runtime_error("Local store requires 'path' config");
        }
        return create_local(it->second, flag("bulk_delete"));
    }

    if (type == "swift") {
        SwiftStoreConfig config;
        auto it = params.end();
        if ((it = params.find("username")) != params.end()) config.username = it->second;
        if ((it = params.find("password")) != params.end()) config.password = it->second;
        if ((it = params.find("authurl")) != params.end()) config.auth_url = it->second;
        if ((it = params.find("tenant")) != params.end()) config.tenant = it->second;
        if ((it = params.find("tenantid")) != params.end()) config.tenant_id = it->second;
        if ((it = params.find("domain")) != params.end()) config.domain = it->second;
        if ((it = params.find("domainid")) != params.end()) config.domain_id = it->second;
        if ((it = params.find("region")) != params.end()) config.region = it->second;
        config.insecure_skip_verify = flag("insecureskipverify");

        if (config.auth_url.empty()) {
            throw std::runtime_error("Swift store requires 'authurl' config");
        }
        return create_swift(config);
    }

    throw std::runtime_error("Unknown store type: " + type);
}

} // namespace swiftfs
