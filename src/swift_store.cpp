#include "swiftfs/storage/object_store.hpp"
#include "swiftfs/core/constants.hpp"
#include "swiftfs/net/http.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace swiftfs {

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::string md5_hex(std::span<const uint8_t> data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_md5(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string strip_quotes(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::chrono::system_clock::time_point from_tm_utc(std::tm& tm) {
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// "Wed, 21 Oct 2015 07:28:00 GMT"
std::chrono::system_clock::time_point parse_http_date(const std::string& value) {
    std::tm tm{};
    std::istringstream ss(value);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) return {};
    return from_tm_utc(tm);
}

// Listing timestamps: "2015-10-21T07:28:00.123456" (UTC)
std::chrono::system_clock::time_point parse_listing_date(const std::string& value) {
    std::tm tm{};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return {};
    return from_tm_utc(tm);
}

template <typename Result>
Result failure_from(const net::HttpResponse& response) {
    Result result;
    result.success = false;
    result.status_code = response.status_code;
    if (!response.error.empty()) {
        result.error_message = response.error;
    } else {
        result.error_message = "HTTP " + std::to_string(response.status_code);
        auto body = response.body_string();
        if (!body.empty() && body.size() < 512) {
            result.error_message += ": " + body;
        }
    }
    return result;
}

ObjectMetadata metadata_from_headers(const net::HttpHeaders& headers) {
    ObjectMetadata meta;
    meta.size = headers.content_length().value_or(0);
    meta.content_type = headers.content_type().value_or(constants::DEFAULT_CONTENT_TYPE);
    meta.etag = strip_quotes(headers.get("ETag").value_or(""));
    if (auto lm = headers.get("Last-Modified")) {
        meta.last_modified = parse_http_date(*lm);
    }
    if (auto manifest = headers.get(constants::OBJECT_MANIFEST_HEADER)) {
        meta.manifest = ManifestRef::parse(net::url_decode(*manifest));
    }
    meta.user_metadata = headers.with_prefix("X-Object-Meta-");
    return meta;
}

// Strip a trailing "/" so auth URLs can be suffixed uniformly
std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

}  // namespace

// ============================================================================
// SwiftObjectStore - OpenStack Swift implementation
// ============================================================================

class SwiftObjectStore : public ObjectStore {
public:
    explicit SwiftObjectStore(const SwiftStoreConfig& config)
        : config_(config) {
        net::HttpClientConfig http_config;
        http_config.user_agent = constants::USER_AGENT;
        http_config.verify_ssl = !config_.insecure_skip_verify;
        http_config.connect_timeout = std::chrono::seconds(constants::DEFAULT_CONNECT_TIMEOUT_SECONDS);
        http_config.total_timeout = std::chrono::seconds(constants::DEFAULT_REQUEST_TIMEOUT_SECONDS);
        http_client_ = std::make_unique<net::HttpClient>(http_config);

        std::string err = authenticate();
        if (!err.empty()) {
            throw std::runtime_error("Swift authentication failed: " + err);
        }
        capabilities_ = detect_capabilities();

        std::cerr << "[swiftfs] authenticated against " << config_.auth_url
                  << " (storage " << storage_url_ << ", bulk delete "
                  << (capabilities_.bulk_delete ? "supported" : "unsupported") << ")\n";
    }

    std::string type_name() const override { return "swift"; }

    StoreResult create_container(const std::string& container) override {
        auto request = net::HttpRequest::put(container_url(container), {});
        auto response = send(request);
        if (!response.ok()) {
            return failure_from<StoreResult>(response);
        }
        return {true, response.status_code, ""};
    }

    HeadResult head(const std::string& container,
                    const std::string& name) const override {
        auto response = send(net::HttpRequest::head(object_url(container, name)));
        if (!response.ok()) {
            return failure_from<HeadResult>(response);
        }

        HeadResult result;
        result.success = true;
        result.status_code = response.status_code;
        result.metadata = metadata_from_headers(response.headers);
        return result;
    }

    GetResult get(const std::string& container,
                  const std::string& name,
                  const GetOptions& options) const override {
        auto request = net::HttpRequest::get(object_url(container, name));

        if (options.range_start || options.range_end) {
            uint64_t start = options.range_start.value_or(0);
            std::optional<uint64_t> end_inclusive;
            if (options.range_end) {
                if (*options.range_end <= start) {
                    GetResult empty;
                    empty.success = true;
                    empty.status_code = 200;
                    return empty;
                }
                end_inclusive = *options.range_end - 1;
            }
            request.byte_range = std::make_pair(start, end_inclusive);
        }

        auto response = send(request);
        if (!response.ok()) {
            return failure_from<GetResult>(response);
        }

        GetResult result;
        result.success = true;
        result.status_code = response.status_code;
        result.metadata = metadata_from_headers(response.headers);
        result.data = std::move(response.body);
        return result;
    }

    PutResult put(const std::string& container,
                  const std::string& name,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        auto request = net::HttpRequest::put(object_url(container, name),
                                             std::vector<uint8_t>(data.begin(), data.end()));

        request.headers.set_content_type(options.content_type.empty()
            ? constants::DEFAULT_CONTENT_TYPE : options.content_type);
        if (options.manifest) {
            request.headers.set(constants::OBJECT_MANIFEST_HEADER,
                                net::url_encode(options.manifest->to_header(), true));
        }
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("X-Object-Meta-" + k, v);
        }

        // Swift verifies the body against ETag and answers 422 on mismatch
        std::string expected_etag = md5_hex(data);
        request.headers.set("ETag", expected_etag);

        auto response = send(request);
        if (!response.ok()) {
            return failure_from<PutResult>(response);
        }

        PutResult result;
        result.etag = strip_quotes(response.headers.get("ETag").value_or(""));
        if (!result.etag.empty() && result.etag != expected_etag) {
            result.success = false;
            result.status_code = response.status_code;
            result.error_message = "ETag mismatch for " + container + "/" + name +
                                   ": sent " + expected_etag + ", stored " + result.etag;
            return result;
        }

        result.success = true;
        result.status_code = response.status_code;
        return result;
    }

    StoreResult remove(const std::string& container,
                       const std::string& name) override {
        auto response = send(net::HttpRequest::del(object_url(container, name)));
        if (!response.ok()) {
            return failure_from<StoreResult>(response);
        }
        return {true, response.status_code, ""};
    }

    BulkDeleteResult bulk_delete(const std::vector<ObjectPath>& objects) override {
        BulkDeleteResult result;
        if (objects.empty()) {
            result.success = true;
            result.status_code = 200;
            return result;
        }

        std::string body;
        for (const auto& obj : objects) {
            body += net::url_encode("/" + obj.container + "/" + obj.name, true);
            body += "\n";
        }

        auto request = net::HttpRequest::post(storage_url_ + "?bulk-delete", body);
        request.headers.set_content_type("text/plain");
        request.headers.set("Accept", "application/json");

        auto response = send(request);
        if (!response.ok()) {
            return failure_from<BulkDeleteResult>(response);
        }

        // The HTTP status is 200 even when individual deletes failed; the
        // real outcome is in the JSON body.
        try {
            auto j = nlohmann::json::parse(response.body_string());
            result.deleted = j.value("Number Deleted", size_t{0});
            result.missing = j.value("Number Not Found", size_t{0});
            std::string status = j.value("Response Status", std::string{"200 OK"});
            result.status_code = std::stoi(status.substr(0, status.find(' ')));
            if (j.contains("Errors") && j["Errors"].is_array()) {
                for (const auto& e : j["Errors"]) {
                    if (e.is_array() && e.size() >= 2) {
                        result.errors.push_back(e[0].get<std::string>() + ": " +
                                                e[1].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.status_code = response.status_code;
            result.error_message = std::string("Invalid bulk delete response: ") + e.what();
            return result;
        }

        result.success = net::is_success_status(result.status_code) && result.errors.empty();
        if (!result.success) {
            result.error_message = "Bulk delete failed (" + std::to_string(result.status_code) + ")";
            if (!result.errors.empty()) {
                result.error_message += ": " + result.errors.front();
            }
        }
        return result;
    }

    ListResult list(const std::string& container,
                    const ListOptions& options) const override {
        ListResult result;
        std::string marker;

        while (true) {
            std::string url = container_url(container) + "?format=json&limit=" +
                              std::to_string(constants::LIST_PAGE_SIZE);
            if (!options.prefix.empty()) {
                url += "&prefix=" + net::url_encode(options.prefix);
            }
            if (!options.delimiter.empty()) {
                url += "&delimiter=" + net::url_encode(options.delimiter);
            }
            if (!marker.empty()) {
                url += "&marker=" + net::url_encode(marker);
            }

            auto response = send(net::HttpRequest::get(url));
            if (!response.ok()) {
                return failure_from<ListResult>(response);
            }
            // 204: empty container
            if (response.status_code == 204 || response.body.empty()) {
                break;
            }

            size_t page_count = 0;
            try {
                auto j = nlohmann::json::parse(response.body_string());
                for (const auto& item : j) {
                    ListEntry entry;
                    if (item.contains("subdir")) {
                        entry.name = item["subdir"].get<std::string>();
                        entry.is_subdir = true;
                    } else {
                        entry.name = item.value("name", std::string{});
                        entry.size = item.value("bytes", uint64_t{0});
                        entry.content_type = item.value("content_type", std::string{});
                        entry.etag = item.value("hash", std::string{});
                        entry.last_modified = parse_listing_date(item.value("last_modified", std::string{}));
                    }
                    marker = entry.name;
                    result.entries.push_back(std::move(entry));
                    ++page_count;
                }
            } catch (const std::exception& e) {
                result.success = false;
                result.status_code = response.status_code;
                result.error_message = std::string("Invalid listing response: ") + e.what();
                return result;
            }

            if (page_count < constants::LIST_PAGE_SIZE) {
                break;
            }
        }

        result.success = true;
        result.status_code = 200;
        return result;
    }

    StoreResult copy(const std::string& source_container,
                     const std::string& source_name,
                     const std::string& dest_container,
                     const std::string& dest_name) override {
        auto request = net::HttpRequest::put(object_url(dest_container, dest_name), {});
        request.headers.set("X-Copy-From",
                            net::url_encode("/" + source_container + "/" + source_name, true));

        auto response = send(request);
        if (!response.ok()) {
            return failure_from<StoreResult>(response);
        }
        return {true, response.status_code, ""};
    }

    StoreCapabilities capabilities() const override { return capabilities_; }

private:
    SwiftStoreConfig config_;
    std::unique_ptr<net::HttpClient> http_client_;
    // Refreshed on token expiry
    mutable std::string storage_url_;
    mutable std::string auth_token_;
    StoreCapabilities capabilities_;

    std::string container_url(const std::string& container) const {
        return storage_url_ + "/" + net::url_encode(container);
    }

    std::string object_url(const std::string& container, const std::string& name) const {
        return container_url(container) + "/" + net::url_encode(name, true);
    }

    // Execute with the current token. An expired token (401) triggers a
    // single re-authentication and the request is replayed once.
    net::HttpResponse send(net::HttpRequest request) const {
        request.headers.set(constants::AUTH_TOKEN_HEADER, auth_token_);
        auto response = http_client_->execute(request);
        if (response.status_code != 401) {
            return response;
        }

        std::string err = authenticate();
        if (!err.empty()) {
            std::cerr << "[swiftfs] re-authentication failed: " << err << "\n";
            return response;
        }
        request.headers.set(constants::AUTH_TOKEN_HEADER, auth_token_);
        return http_client_->execute(request);
    }

    // ------------------------------------------------------------------------
    // Authentication (v1 tempauth, Keystone v2 and v3), chosen by URL suffix
    // ------------------------------------------------------------------------

    int auth_version() const {
        std::string url = trim_trailing_slash(config_.auth_url);
        if (url.ends_with("v3") || url.ends_with("v3.0")) return 3;
        if (url.ends_with("v2.0") || url.ends_with("v2")) return 2;
        return 1;
    }

    std::string authenticate() const {
        switch (auth_version()) {
            case 3: return authenticate_v3();
            case 2: return authenticate_v2();
            default: return authenticate_v1();
        }
    }

    std::string authenticate_v1() const {
        auto request = net::HttpRequest::get(config_.auth_url);
        request.headers.set("X-Auth-User", config_.username);
        request.headers.set("X-Auth-Key", config_.password);

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            return response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                          : response.error;
        }

        auto storage_url = response.headers.get("X-Storage-Url");
        auto token = response.headers.get(constants::AUTH_TOKEN_HEADER);
        if (!storage_url || !token) {
            return "auth response missing X-Storage-Url or X-Auth-Token";
        }
        storage_url_ = trim_trailing_slash(*storage_url);
        auth_token_ = *token;
        return {};
    }

    std::string authenticate_v2() const {
        nlohmann::json body;
        body["auth"]["passwordCredentials"] = {
            {"username", config_.username},
            {"password", config_.password},
        };
        if (!config_.tenant.empty()) body["auth"]["tenantName"] = config_.tenant;
        if (!config_.tenant_id.empty()) body["auth"]["tenantId"] = config_.tenant_id;

        auto request = net::HttpRequest::post(trim_trailing_slash(config_.auth_url) + "/tokens", "");
        request.set_json_body(body.dump());
        request.headers.set("Accept", "application/json");

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            return response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                          : response.error;
        }

        try {
            auto j = nlohmann::json::parse(response.body_string());
            const auto& access = j.at("access");
            auth_token_ = access.at("token").at("id").get<std::string>();
            for (const auto& service : access.at("serviceCatalog")) {
                if (service.value("type", std::string{}) != "object-store") continue;
                for (const auto& ep : service.at("endpoints")) {
                    if (!config_.region.empty() &&
                        ep.value("region", std::string{}) != config_.region) {
                        continue;
                    }
                    storage_url_ = trim_trailing_slash(ep.value("publicURL", std::string{}));
                    return {};
                }
            }
        } catch (const std::exception& e) {
            return std::string("invalid v2 token response: ") + e.what();
        }
        return "no object-store endpoint in service catalog" +
               (config_.region.empty() ? std::string{} : " for region " + config_.region);
    }

    std::string authenticate_v3() const {
        nlohmann::json user = {{"name", config_.username}, {"password", config_.password}};
        if (!config_.domain_id.empty()) {
            user["domain"] = {{"id", config_.domain_id}};
        } else if (!config_.domain.empty()) {
            user["domain"] = {{"name", config_.domain}};
        }

        nlohmann::json body;
        body["auth"]["identity"] = {
            {"methods", nlohmann::json::array({"password"})},
            {"password", {{"user", user}}},
        };

        if (!config_.tenant_id.empty()) {
            body["auth"]["scope"]["project"] = {{"id", config_.tenant_id}};
        } else if (!config_.tenant.empty()) {
            nlohmann::json project = {{"name", config_.tenant}};
            if (!config_.domain_id.empty()) {
                project["domain"] = {{"id", config_.domain_id}};
            } else if (!config_.domain.empty()) {
                project["domain"] = {{"name", config_.domain}};
            }
            body["auth"]["scope"]["project"] = project;
        }

        auto request = net::HttpRequest::post(trim_trailing_slash(config_.auth_url) + "/auth/tokens", "");
        request.set_json_body(body.dump());
        request.headers.set("Accept", "application/json");

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            return response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                          : response.error;
        }

        auto token = response.headers.get("X-Subject-Token");
        if (!token) {
            return "auth response missing X-Subject-Token";
        }
        auth_token_ = *token;

        try {
            auto j = nlohmann::json::parse(response.body_string());
            for (const auto& service : j.at("token").at("catalog")) {
                if (service.value("type", std::string{}) != "object-store") continue;
                for (const auto& ep : service.at("endpoints")) {
                    if (ep.value("interface", std::string{}) != "public") continue;
                    if (!config_.region.empty() &&
                        ep.value("region", std::string{}) != config_.region &&
                        ep.value("region_id", std::string{}) != config_.region) {
                        continue;
                    }
                    storage_url_ = trim_trailing_slash(ep.value("url", std::string{}));
                    return {};
                }
            }
        } catch (const std::exception& e) {
            return std::string("invalid v3 token response: ") + e.what();
        }
        return "no public object-store endpoint in catalog" +
               (config_.region.empty() ? std::string{} : " for region " + config_.region);
    }

    // Query /info once. The proxy root (derived from the storage URL) is
    // tried first, then the location derived from the auth URL.
    StoreCapabilities detect_capabilities() const {
        StoreCapabilities caps;
        for (const auto& base : {storage_url_, config_.auth_url}) {
            auto response = http_client_->execute(net::HttpRequest::get(swift_info_url(base)));
            if (!response.ok()) continue;
            try {
                auto j = nlohmann::json::parse(response.body_string());
                caps.bulk_delete = j.contains("bulk_delete");
                return caps;
            } catch (const std::exception&) {
                // Not a Swift info document; try the next candidate
            }
        }
        return caps;
    }
};

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_swift(const SwiftStoreConfig& config) {
    return std::make_unique<SwiftObjectStore>(config);
}

} // namespace swiftfs
