#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace swiftfs::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

bool is_success_status(int status);

// Percent-encode everything except unreserved characters.
// When keep_slashes is set, '/' is passed through (object paths).
std::string url_encode(const std::string& str, bool keep_slashes = false);
std::string url_decode(const std::string& str);

// Case-insensitive header set. Swift never repeats the headers we read,
// so a later value for the same name replaces the earlier one.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    // Headers whose name starts with prefix, keyed by the remainder
    std::map<std::string, std::string> with_prefix(const std::string& prefix) const;

    const std::map<std::string, std::string>& entries() const { return entries_; }

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::string> entries_;  // lowercase name -> value
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // First byte and optional last byte (inclusive) of a ranged GET
    std::optional<std::pair<uint64_t, std::optional<uint64_t>>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Transport failure text; empty when a status line was received
    std::string error;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;
};

struct HttpClientConfig {
    std::string user_agent;
    bool verify_ssl = true;

    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds total_timeout{900000};
};

// Blocking HTTP client over libcurl. One easy handle, reused between calls.
// Not thread-safe: callers serialize access.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace swiftfs::net
