#include "header_codec.hpp"

#include <new>

#include <pico/utils/binary_codec.hpp>

namespace pico::detail
{

auto header_codec::decode_prefix(ro_blob<header_fixed_size> bytes) noexcept
        -> result<header_prefix>
{
    auto const magic = load_primitive<std::uint16_t>(bytes, magic_position);
    if (magic != magic_number)
    {
        return make_not_pico_error(magic);
    }

    format_version const version{
            load_primitive<std::uint16_t>(bytes, major_position),
            load_primitive<std::uint16_t>(bytes, minor_position)};
    if (version.major_number > supported_version.major_number)
    {
        return make_bad_version_error(version);
    }

    header_prefix prefix{
            .version = version,
            .data_offset = load_primitive<std::uint32_t>(bytes, offset_position),
            .hash = {},
            .key_length
            = load_primitive<std::uint16_t>(bytes, key_length_position),
    };
    copy(bytes.subspan<hash_position, digest_size>(), std::span(prefix.hash));

    if (prefix.key_length == 0)
    {
        return make_error(pico_errc::key_error);
    }
    return prefix;
}

auto header_codec::decode(header_prefix const &prefix,
                          ro_dynblob keyBytes) noexcept -> result<header_fields>
{
    if (keyBytes.size() != prefix.key_length)
    {
        return make_error(pico_errc::internal_error);
    }

    auto const minimumOffset
            = static_cast<std::uint32_t>(header_fixed_size + prefix.key_length);
    if (prefix.data_offset < minimumOffset)
    {
        return make_bad_offset_error(prefix.data_offset, minimumOffset);
    }

    try
    {
        return header_fields{
                .version = prefix.version,
                .data_offset = prefix.data_offset,
                .hash = prefix.hash,
                .key = std::vector<std::byte>(keyBytes.begin(), keyBytes.end()),
        };
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }
}

auto header_codec::encode(rw_dynblob out, header_fields const &fields) noexcept
        -> result<void>
{
    if (out.size() != size_of(fields) || fields.key.size() > max_key_size)
    {
        return make_error(pico_errc::internal_error);
    }

    utils::binary_codec<> codec(out);
    codec.write(magic_number, magic_position);
    codec.write(fields.version.major_number, major_position);
    codec.write(fields.version.minor_number, minor_position);
    codec.write(fields.data_offset, offset_position);
    copy(std::span(fields.hash), out.subspan(hash_position, digest_size));
    codec.write(static_cast<std::uint16_t>(fields.key.size()),
                key_length_position);
    copy(std::span(fields.key), out.subspan(key_position));

    return outcome::success();
}

} // namespace pico::detail
