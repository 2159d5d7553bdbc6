#include <pico/header_format.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>

#include <fmt/format.h>

#include <pico/container.hpp>

namespace pico
{

namespace
{

enum class byte_style
{
    hex_list,
    decimal_list,
    hex_string,
};

template <typename OutputIt>
void dump_bytes(OutputIt out, ro_dynblob bytes, byte_style style)
{
    bool first = true;
    for (auto const b : bytes)
    {
        auto const value = std::to_integer<unsigned>(b);
        switch (style)
        {
        case byte_style::hex_list:
            fmt::format_to(out, "{}0x{:02X}", first ? "" : ", ", value);
            break;
        case byte_style::decimal_list:
            fmt::format_to(out, "{}{}", first ? "" : ", ", value);
            break;
        case byte_style::hex_string:
            fmt::format_to(out, "{:02X}", value);
            break;
        }
        first = false;
    }
}

constexpr std::array<std::byte, 2> magic_bytes{
        std::byte{magic_number >> 8}, std::byte{magic_number & 0xFFu}};

} // namespace

auto parse_header_format(std::string_view name) noexcept
        -> std::optional<header_format>
{
    constexpr std::array formats{header_format::dict, header_format::json,
                                 header_format::yaml, header_format::xml};

    auto const equalsIgnoreCase = [name](std::string_view candidate) {
        return std::ranges::equal(
                name, candidate, [](char l, char r) {
                    return std::toupper(static_cast<unsigned char>(l))
                           == std::toupper(static_cast<unsigned char>(r));
                });
    };
    for (auto const format : formats)
    {
        if (equalsIgnoreCase(to_string(format)))
        {
            return format;
        }
    }
    return std::nullopt;
}

auto to_string(header_format format) noexcept -> std::string_view
{
    using namespace std::string_view_literals;
    switch (format)
    {
    case header_format::dict:
        return "DICT"sv;
    case header_format::json:
        return "JSON"sv;
    case header_format::yaml:
        return "YAML"sv;
    case header_format::xml:
        return "XML"sv;
    }
    return "unknown"sv;
}

auto summarize(container const &picoFile) -> header_summary
{
    auto const key = picoFile.key();
    return {
            .version = picoFile.version(),
            .offset = picoFile.offset(),
            .hash = picoFile.hash(),
            .key = std::vector<std::byte>(key.begin(), key.end()),
            .metadata_length = picoFile.metadata_length(),
    };
}

auto format_header(header_summary const &summary, header_format format)
        -> std::string
{
    std::string text;
    auto out = std::back_inserter(text);

    auto const &[version, offset, hash, key, metadataLength] = summary;
    auto const majorNumber = version.major_number;
    auto const minorNumber = version.minor_number;

    switch (format)
    {
    case header_format::dict:
    case header_format::json:
    {
        // python tolerates a trailing comma, JSON doesn't
        auto const style = format == header_format::dict
                                   ? byte_style::hex_list
                                   : byte_style::decimal_list;
        auto const lastSeparator = format == header_format::dict ? "," : "";

        fmt::format_to(out, "{{\n    \"magic\" : [ ");
        dump_bytes(out, magic_bytes, style);
        fmt::format_to(out, " ],\n");
        fmt::format_to(out, "    \"major\" : {},\n", majorNumber);
        fmt::format_to(out, "    \"minor\" : {},\n", minorNumber);
        fmt::format_to(out, "    \"offset\" : {},\n", offset);
        fmt::format_to(out, "    \"hash\" : [ ");
        dump_bytes(out, hash, style);
        fmt::format_to(out, " ],\n");
        fmt::format_to(out, "    \"key_length\" : {},\n", key.size());
        fmt::format_to(out, "    \"key\" : [ ");
        dump_bytes(out, key, style);
        fmt::format_to(out, " ],\n");
        fmt::format_to(out, "    \"md_length\" : {}{}\n}}\n", metadataLength,
                       lastSeparator);
        break;
    }

    case header_format::yaml:
        fmt::format_to(out, "magic: [ ");
        dump_bytes(out, magic_bytes, byte_style::decimal_list);
        fmt::format_to(out, " ]\n");
        fmt::format_to(out, "major: {}\n", majorNumber);
        fmt::format_to(out, "minor: {}\n", minorNumber);
        fmt::format_to(out, "offset: {}\n", offset);
        fmt::format_to(out, "hash: [ ");
        dump_bytes(out, hash, byte_style::decimal_list);
        fmt::format_to(out, " ]\n");
        fmt::format_to(out, "key_length: {}\n", key.size());
        fmt::format_to(out, "key: [ ");
        dump_bytes(out, key, byte_style::decimal_list);
        fmt::format_to(out, " ]\n");
        fmt::format_to(out, "md_length: {}\n", metadataLength);
        break;

    case header_format::xml:
        fmt::format_to(out,
                       "<pico magic='0x{:04X}' major='{}' minor='{}' "
                       "offset='{}'",
                       magic_number, majorNumber, minorNumber, offset);
        fmt::format_to(out, " hash='");
        dump_bytes(out, hash, byte_style::hex_string);
        fmt::format_to(out, "' key='");
        dump_bytes(out, key, byte_style::hex_string);
        fmt::format_to(out, "' md_length='{}' />\n", metadataLength);
        break;
    }
    return text;
}

} // namespace pico
