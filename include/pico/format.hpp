#pragma once

#include <cstddef>
#include <cstdint>

#include <array>

namespace pico
{

struct format_version
{
    std::uint16_t major_number;
    std::uint16_t minor_number;

    friend constexpr auto operator==(format_version,
                                     format_version) noexcept -> bool
            = default;
};

/**
 * Packs a version into a single word, major in the upper half.
 */
constexpr auto pack(format_version v) noexcept -> std::uint32_t
{
    return static_cast<std::uint32_t>(v.major_number) << 16 | v.minor_number;
}
constexpr auto unpack_version(std::uint32_t packed) noexcept -> format_version
{
    return {static_cast<std::uint16_t>(packed >> 16),
            static_cast<std::uint16_t>(packed & 0xFFFFu)};
}

inline constexpr std::uint16_t magic_number = 0x91C0u;
inline constexpr format_version supported_version{1, 0};

// header layout, all fields are stored in big endian byte order
inline constexpr std::size_t magic_position = 0x00;
inline constexpr std::size_t major_position = 0x02;
inline constexpr std::size_t minor_position = 0x04;
inline constexpr std::size_t offset_position = 0x06;
inline constexpr std::size_t hash_position = 0x0A;
inline constexpr std::size_t key_length_position = 0x1A;
inline constexpr std::size_t key_position = 0x1C;

inline constexpr std::size_t header_fixed_size = key_position;
inline constexpr std::size_t digest_size = 16;
inline constexpr std::size_t max_key_size = 0xFFFFu;

//! the unit in which the content hash and the cli stream the data region
inline constexpr std::size_t chunk_size = 4096;

using content_digest = std::array<std::byte, digest_size>;

} // namespace pico
