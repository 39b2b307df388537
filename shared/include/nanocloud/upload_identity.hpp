/**
 * NanoCloud - Deterministic upload identifiers and chunk planning.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nanocloud
{

    inline constexpr std::size_t kMaxUploadIdLength = 128;

    // The metadata tuple a resumable upload is keyed by. The same tuple on any
    // device produces the same identifier.
    struct UploadIdentity
    {
        std::string filename;
        std::uint64_t size{};
        std::int64_t last_modified{};
        std::string destination;
        std::string relative_path;
    };

    // 160-bit BLAKE2b over a length-prefixed encoding of the tuple, hex encoded.
    std::string derive_upload_id(const UploadIdentity &identity);

    // Non-empty, at most kMaxUploadIdLength, only [A-Za-z0-9-].
    bool is_valid_upload_id(std::string_view upload_id) noexcept;

    struct ChunkRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size);

    ChunkRange chunk_range(std::uint64_t index, std::uint64_t file_size, std::uint64_t chunk_size);

} // namespace nanocloud
