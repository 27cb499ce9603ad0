#pragma once

#include "wopan/core/error.hpp"
#include "wopan/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wopan::server {

/// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment
EnvLookup process_environment();

/**
 * @brief Settings for wopan_server
 *
 * SOURCES (later wins):
 * 1. Defaults below
 * 2. WOPAN_ACCESS_TOKEN, WOPAN_TEMP_DIR, WOPAN_PORT
 * 3. Command-line flags
 */
struct ServiceConfig {
    uint16_t port = 8000;
    unsigned threads = 4;
    std::filesystem::path temp_dir = "temp";
    std::string access_token;
    std::size_t max_body_size = std::size_t{1} << 30;
    std::string log_level = "info";
    bool verify_tls = true;
};

/**
 * @brief Settings for the one-shot wopan_upload tool
 */
struct UploadCommand {
    std::filesystem::path file;
    std::string directory_id = upload::kRootDirectoryId;
    std::string access_token;
    std::size_t chunk_size = upload::kDefaultChunkSize;
    std::string log_level = "info";
    bool verify_tls = true;
};

/**
 * @brief Parse wopan_server arguments
 *
 * Flags: --port N, --threads N, --temp DIR, --token T, --max-body BYTES,
 * --log-level L, --insecure. Unknown flags and malformed numbers are
 * Validation errors.
 */
Expected<ServiceConfig> load_service_config(const std::vector<std::string>& args,
                                            const EnvLookup& env = process_environment());

/**
 * @brief Parse wopan_upload arguments
 *
 * Usage: wopan_upload <file> [--directory ID] [--token T] [--chunk-size BYTES]
 *                            [--log-level L] [--insecure]
 */
Expected<UploadCommand> load_upload_command(const std::vector<std::string>& args,
                                            const EnvLookup& env = process_environment());

std::string service_usage(const std::string& program);
std::string upload_usage(const std::string& program);

} // namespace wopan::server
