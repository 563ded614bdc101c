#include "swiftfs/net/http.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace swiftfs::net {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// SWIFTFS_REQUEST_TIMEOUT (seconds, 5..3600) overrides the total timeout
std::chrono::milliseconds effective_total_timeout(std::chrono::milliseconds configured) {
    const char* env = std::getenv("SWIFTFS_REQUEST_TIMEOUT");
    if (!env) return configured;

    char* end = nullptr;
    unsigned long secs = std::strtoul(env, &end, 10);
    if (end == env || *end != '\0' || secs < 5 || secs > 3600) {
        std::cerr << "[swiftfs] ignoring SWIFTFS_REQUEST_TIMEOUT=" << env
                  << " (expected 5..3600 seconds)\n";
        return configured;
    }
    return std::chrono::seconds(secs);
}

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    body->insert(body->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;
    std::string line(buffer, bytes);

    // Redirects and interim responses each start a new header block
    if (line.rfind("HTTP/", 0) == 0) {
        *headers = HttpHeaders{};
        return bytes;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return bytes;

    auto first = line.find_first_not_of(" \t", colon + 1);
    auto last = line.find_last_not_of(" \t\r\n");
    std::string value;
    if (first != std::string::npos && last != std::string::npos && last >= first) {
        value = line.substr(first, last - first + 1);
    }
    headers->set(line.substr(0, colon), value);
    return bytes;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

}  // namespace

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str, bool keep_slashes) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        bool plain = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
                     (keep_slashes && c == '/');
        if (plain) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0F];
        }
    }
    return out;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += str[i] == '+' ? ' ' : str[i];
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    entries_[lowercase(name)] = value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = entries_.find(lowercase(name));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> HttpHeaders::with_prefix(const std::string& prefix) const {
    std::map<std::string, std::string> result;
    auto key = lowercase(prefix);
    for (auto it = entries_.lower_bound(key);
         it != entries_.end() && it->first.compare(0, key.size(), key) == 0; ++it) {
        result[it->first.substr(key.size())] = it->second;
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value || value->empty()) return std::nullopt;
    char* end = nullptr;
    unsigned long long n = std::strtoull(value->c_str(), &end, 10);
    if (*end != '\0') return std::nullopt;
    return n;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

namespace {
HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}
}  // namespace

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    auto req = make_request(HttpMethod::POST, url);
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set_content_type("application/json");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

        config_.total_timeout = effective_total_timeout(config_.total_timeout);
        if (!config_.verify_ssl) {
            std::cerr << "[swiftfs] WARNING: TLS certificate verification is disabled\n";
        }
        handle_.reset(curl_easy_init());
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        if (!handle_) {
            response.error = "curl_easy_init failed";
            return response;
        }

        CURL* curl = handle_.get();
        curl_easy_reset(curl);
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Bodies are always fully buffered, so PUT goes out as a sized
        // request body with an overridden verb instead of a chunked upload.
        static const char empty_body[] = "";
        bool has_body = request.method == HttpMethod::PUT || request.method == HttpMethod::POST;
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
                break;
            case HttpMethod::POST:
                break;
        }
        if (has_body) {
            const void* data = request.body.empty()
                ? static_cast<const void*>(empty_body)
                : static_cast<const void*>(request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        HeaderList header_list;
        auto append = [&header_list](const std::string& line) {
            header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
        };
        for (const auto& [name, value] : request.headers.entries()) {
            append(name + ": " + value);
        }
        append("Expect:");
        // Keep curl's form content type off object writes such as server-side copies
        if (has_body && !request.headers.content_type()) {
            append("Content-Type:");
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-";
            if (request.byte_range->second) {
                range += std::to_string(*request.byte_range->second);
            }
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            response.error = std::string(request.url) + ": " + curl_easy_strerror(rc);
            response.body.clear();
            return response;
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        return response;
    }

private:
    HttpClientConfig config_;
    EasyHandle handle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

} // namespace swiftfs::net
