#include "nanocloud/upload_identity.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "nanocloud/crypto.hpp"

namespace nanocloud
{

    namespace
    {
        constexpr std::size_t kIdentityDigestSize = 20;

        void append_u64_le(std::vector<std::byte> &out, std::uint64_t value)
        {
            for (int shift = 0; shift < 64; shift += 8)
            {
                out.push_back(static_cast<std::byte>((value >> shift) & 0xFFu));
            }
        }

        void append_field(std::vector<std::byte> &out, std::string_view value)
        {
            append_u64_le(out, static_cast<std::uint64_t>(value.size()));
            for (const char ch : value)
            {
                out.push_back(static_cast<std::byte>(ch));
            }
        }

        bool is_id_char(char ch) noexcept
        {
            return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-';
        }

    } // namespace

    std::string derive_upload_id(const UploadIdentity &identity)
    {
        std::vector<std::byte> encoded;
        encoded.reserve(64 + identity.filename.size() + identity.destination.size() + identity.relative_path.size());
        append_field(encoded, identity.filename);
        append_u64_le(encoded, identity.size);
        append_u64_le(encoded, static_cast<std::uint64_t>(identity.last_modified));
        append_field(encoded, identity.destination);
        append_field(encoded, identity.relative_path);
        return crypto::hash_bytes(encoded, kIdentityDigestSize);
    }

    bool is_valid_upload_id(std::string_view upload_id) noexcept
    {
        if (upload_id.empty() || upload_id.size() > kMaxUploadIdLength)
        {
            return false;
        }
        return std::all_of(upload_id.begin(), upload_id.end(), is_id_char);
    }

    std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        if (file_size == 0)
        {
            return 1;
        }
        return (file_size + chunk_size - 1) / chunk_size;
    }

    ChunkRange chunk_range(std::uint64_t index, std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (index >= chunk_count(file_size, chunk_size))
        {
            throw std::out_of_range("Chunk index beyond end of file");
        }
        const auto offset = index * chunk_size;
        return {.offset = offset, .length = std::min(chunk_size, file_size - offset)};
    }

} // namespace nanocloud
