#pragma once

#include <cstdint>

#include <vector>

#include <pico/disappointment.hpp>
#include <pico/format.hpp>
#include <pico/span.hpp>

namespace pico::detail
{

/**
 * The fixed size part of the header, i.e. everything up to the key bytes.
 */
struct header_prefix
{
    format_version version;
    std::uint32_t data_offset;
    content_digest hash;
    std::uint16_t key_length;
};

struct header_fields
{
    format_version version;
    std::uint32_t data_offset;
    content_digest hash;
    std::vector<std::byte> key;
};

class header_codec
{
public:
    /**
     * Parses the fixed header part and validates, in this order, the magic
     * number, the version and the key length.
     */
    static auto decode_prefix(ro_blob<header_fixed_size> bytes) noexcept
            -> result<header_prefix>;

    /**
     * Completes a prefix with the key bytes and validates the data offset
     * against the end of the header.
     */
    static auto decode(header_prefix const &prefix,
                       ro_dynblob keyBytes) noexcept -> result<header_fields>;

    static auto size_of(header_fields const &fields) noexcept -> std::size_t
    {
        return header_fixed_size + fields.key.size();
    }

    /**
     * Serializes the header. out must be exactly size_of(fields) bytes.
     */
    static auto encode(rw_dynblob out, header_fields const &fields) noexcept
            -> result<void>;
};

} // namespace pico::detail
