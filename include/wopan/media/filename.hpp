#pragma once

#include "wopan/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace wopan::media {

/**
 * @brief Turn an arbitrary title into a safe file stem
 *
 * Removes / \ : * ? " < > |, replaces spaces with '_', collapses runs of
 * '_', keeps at most @p max_length characters (UTF-8 code points, never a
 * partial sequence) and strips trailing '_'. An empty result becomes "video".
 */
std::string sanitize_filename(std::string_view title, std::size_t max_length = 50);

/// First 8 hex digits of a random UUID
std::string short_id();

/**
 * @brief Scratch directory tree for extracted and received files
 *
 * LAYOUT:
 *   <root>/<video type>/<stem>_<8 hex>.<ext>   extracted media
 *   <root>/uploads/<8 hex>/<basename>           files received over HTTP
 *
 * Directories are created on demand, so a missing root is not an error
 * until something is written.
 */
class TempWorkspace {
public:
    explicit TempWorkspace(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    /// <root>/<category>, created if needed
    Expected<std::filesystem::path> directory_for(std::string_view category) const;

    /**
     * @brief Fresh path for a file received from a client
     *
     * The basename of @p original_name is kept so the remote file gets the
     * name the client sent; path components are stripped.
     */
    Expected<std::filesystem::path> reserve_upload_path(std::string_view original_name) const;

    /// Remove a file created through this workspace and its per-upload directory
    void release(const std::filesystem::path& path) const;

private:
    std::filesystem::path root_;
};

} // namespace wopan::media
