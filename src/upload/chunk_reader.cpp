#include "wopan/upload/chunk_reader.hpp"

#include <algorithm>

namespace wopan::upload {
namespace fs = std::filesystem;

Expected<ChunkReader> ChunkReader::open(const fs::path& source, std::size_t chunk_size) {
    if (chunk_size == 0) {
        return Err<ChunkReader>(make_error(ErrorKind::Validation, "chunk_size must be > 0"));
    }

    std::error_code ec;
    const auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Err<ChunkReader>(make_error(ErrorKind::NotFound, "File not found: " + source.string()));
    }
    if (!fs::is_regular_file(status)) {
        return Err<ChunkReader>(make_error(ErrorKind::Validation, "Not a regular file: " + source.string()));
    }

    const auto file_size = fs::file_size(source, ec);
    if (ec) {
        return Err<ChunkReader>(make_error(ErrorKind::Internal,
                                           "Failed to stat " + source.string() + ": " + ec.message()));
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<ChunkReader>(make_error(ErrorKind::Validation, "Failed to open source file: " + source.string()));
    }

    return Ok<ChunkReader, Error>(ChunkReader(std::move(input), source, file_size, chunk_size));
}

std::uint32_t ChunkReader::total_parts_for(std::uint64_t file_size, std::size_t chunk_size) {
    const auto parts = (file_size + chunk_size - 1) / chunk_size;
    return static_cast<std::uint32_t>(std::max<std::uint64_t>(1, parts));
}

ChunkReader::ChunkReader(std::ifstream input, fs::path source,
                         std::uint64_t file_size, std::size_t chunk_size)
    : input_(std::move(input)),
      source_(std::move(source)),
      file_size_(file_size),
      chunk_size_(chunk_size),
      total_parts_(total_parts_for(file_size, chunk_size)) {}

Expected<ChunkWindow> ChunkReader::next() {
    if (!has_next()) {
        return Err<ChunkWindow>(make_error(ErrorKind::Internal, "No parts left in " + source_.string()));
    }

    const auto expected = static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size_, file_size_ - offset_));

    ChunkWindow window;
    window.part_index = next_part_;
    window.offset = offset_;
    window.data.resize(expected);

    if (expected > 0) {
        input_.read(reinterpret_cast<char*>(window.data.data()), static_cast<std::streamsize>(expected));
        const auto bytes_read = static_cast<std::size_t>(input_.gcount());
        if (bytes_read != expected) {
            return Err<ChunkWindow>(make_error(ErrorKind::Internal,
                "Short read on " + source_.string() + " part " + std::to_string(next_part_) +
                ": expected " + std::to_string(expected) + " bytes, got " + std::to_string(bytes_read)));
        }
    }

    offset_ += expected;
    ++next_part_;
    return Ok<ChunkWindow, Error>(std::move(window));
}

} // namespace wopan::upload
