#pragma once

#include <cstdint>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pico/format.hpp>
#include <pico/span.hpp>

namespace pico
{

class container;

/**
 * Text representations of a pico header.
 */
enum class header_format
{
    //! a python dict literal with hexadecimal byte lists
    dict,
    //! JSON with decimal byte lists
    json,
    //! YAML 1.2 with decimal flow sequences
    yaml,
    //! a single xml element with hexadecimal strings as attributes
    xml,
};

/**
 * Parses a header format name, case insensitive.
 */
auto parse_header_format(std::string_view name) noexcept
        -> std::optional<header_format>;
auto to_string(header_format format) noexcept -> std::string_view;

/**
 * The header values of a container.
 */
struct header_summary
{
    format_version version;
    std::uint32_t offset;
    content_digest hash;
    std::vector<std::byte> key;
    std::uint32_t metadata_length;
};

auto summarize(container const &picoFile) -> header_summary;

/**
 * Renders the header, the result is terminated with a line feed.
 */
auto format_header(header_summary const &summary, header_format format)
        -> std::string;

} // namespace pico
