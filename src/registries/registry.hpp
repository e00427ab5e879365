#pragma once
#include "../http.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace crancache {

// Upstream registry failure: transport error, unexpected status or a body
// that does not parse.
class RegistryError : public std::runtime_error {
public:
    RegistryError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

inline std::vector<Header> json_request_headers() {
    return {
        {"User-Agent", "crancache/1.0"},
        {"Accept", "application/json"}
    };
}

} // namespace crancache
