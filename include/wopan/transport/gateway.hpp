#pragma once

#include "wopan/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wopan::transport {

using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One multipart/form-data POST: ordered text fields plus one file part
 */
struct ChunkRequest {
    std::string url;
    FormFields headers;
    FormFields fields;
    std::string file_field = "file";
    std::string file_name;
    std::string file_content_type = "application/octet-stream";
    const std::vector<std::uint8_t>* file_data = nullptr;  ///< Borrowed, outlives the call
    std::chrono::seconds timeout{120};

    /// Value of the first field named @p name, empty if absent
    std::string field(const std::string& name) const {
        for (const auto& [key, value] : fields) {
            if (key == name) {
                return value;
            }
        }
        return {};
    }
};

struct TransportResponse {
    int status_code = 0;
    std::string body;
};

/**
 * @brief Sends a single chunk request
 *
 * Returns TransientTransport for anything that prevented a complete HTTP
 * exchange (DNS, connect, TLS, timeout, truncated response). Any HTTP status
 * is returned as a response; interpreting it is the caller's job.
 */
class TransportGateway {
public:
    virtual ~TransportGateway() = default;

    virtual Expected<TransportResponse> post(const ChunkRequest& request) = 0;
};

} // namespace wopan::transport
