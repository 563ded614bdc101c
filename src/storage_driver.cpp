#include "swiftfs/driver/storage_driver.hpp"

#include <cctype>

namespace swiftfs {

const char* driver_error_code_to_string(DriverErrorCode code) {
    switch (code) {
        case DriverErrorCode::None: return "ok";
        case DriverErrorCode::PathNotFound: return "path not found";
        case DriverErrorCode::InvalidPath: return "invalid path";
        case DriverErrorCode::Unsupported: return "unsupported";
        case DriverErrorCode::Remote: return "remote error";
    }
    return "unknown";
}

std::string DriverError::to_string() const {
    std::string s = driver_error_code_to_string(code);
    if (!path.empty()) s += ": " + path;
    if (status_code != 0) s += " (HTTP " + std::to_string(status_code) + ")";
    if (!message.empty()) s += ": " + message;
    return s;
}

DriverError DriverError::path_not_found(const std::string& path) {
    return {DriverErrorCode::PathNotFound, path, 404, ""};
}

DriverError DriverError::invalid_path(const std::string& path) {
    return {DriverErrorCode::InvalidPath, path, 0, ""};
}

DriverError DriverError::unsupported(const std::string& path, const std::string& what) {
    return {DriverErrorCode::Unsupported, path, 0, what};
}

DriverError translate_store_error(const std::string& path, const StoreResult& result) {
    if (result.success) {
        return {};
    }
    if (result.not_found()) {
        return DriverError::path_not_found(path);
    }
    return {DriverErrorCode::Remote, path, result.status_code, result.error_message};
}

bool is_valid_path(const std::string& path) {
    if (path.size() < 2 || path.front() != '/' || path.back() == '/') {
        return false;
    }
    bool prev_slash = false;
    for (char c : path) {
        if (c == '/') {
            if (prev_slash) return false;
            prev_slash = true;
            continue;
        }
        prev_slash = false;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace swiftfs
