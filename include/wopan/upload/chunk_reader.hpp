#pragma once

#include "wopan/core/error.hpp"
#include "wopan/upload/types.hpp"

#include <filesystem>
#include <fstream>

namespace wopan::upload {

/**
 * @brief Sequential, non-overlapping reader over fixed-size windows of one file
 *
 * Owns the file handle for its whole lifetime. The part count is fixed when
 * the reader is opened and a zero-byte file yields exactly one empty part.
 */
class ChunkReader {
public:
    static Expected<ChunkReader> open(const std::filesystem::path& source,
                                      std::size_t chunk_size = kDefaultChunkSize);

    /// max(1, ceil(file_size / chunk_size))
    static std::uint32_t total_parts_for(std::uint64_t file_size, std::size_t chunk_size);

    ChunkReader(ChunkReader&&) = default;
    ChunkReader& operator=(ChunkReader&&) = default;

    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint32_t total_parts() const noexcept { return total_parts_; }
    [[nodiscard]] bool has_next() const noexcept { return next_part_ <= total_parts_; }

    /**
     * @brief Read the next window
     *
     * Fails if the file got shorter since it was opened.
     */
    Expected<ChunkWindow> next();

private:
    ChunkReader(std::ifstream input, std::filesystem::path source,
                std::uint64_t file_size, std::size_t chunk_size);

    std::ifstream input_;
    std::filesystem::path source_;
    std::uint64_t file_size_ = 0;
    std::size_t chunk_size_ = 0;
    std::uint32_t total_parts_ = 0;
    std::uint32_t next_part_ = 1;
    std::uint64_t offset_ = 0;
};

} // namespace wopan::upload
