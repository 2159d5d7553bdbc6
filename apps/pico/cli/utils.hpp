#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <pico/disappointment.hpp>
#include <pico/llfio.hpp>
#include <pico/span.hpp>

#include "pico/cli/error.hpp"

namespace pico::cli
{

inline constexpr std::string_view default_encoded_extension = ".pico";
inline constexpr std::string_view default_decoded_extension = ".raw";

/**
 * @brief Decodes a key given as a sequence of hex digits, e.g. "5521E49A".
 */
auto hex_decode_key(std::string_view hexKey) -> cli_result<std::vector<std::byte>>;

/**
 * @brief The output file of an encoding: the input path with the suffix and
 * the extension appended.
 */
auto encoded_output_path(std::string_view input,
                         std::string_view suffix,
                         std::string_view extension) -> std::string;

/**
 * @brief The output file of a decoding: the input path without a trailing
 * .pico extension with the suffix and the extension appended.
 */
auto decoded_output_path(std::string_view input,
                         std::string_view suffix,
                         std::string_view extension) -> std::string;

/**
 * @brief Opens an existing plain file for reading.
 */
auto open_input_file(std::string const &path) noexcept
        -> result<llfio::file_handle>;
/**
 * @brief Creates a plain file which must not exist yet.
 */
auto create_output_file(std::string const &path) noexcept
        -> result<llfio::file_handle>;

/**
 * @brief Reads up to buffer.size() bytes, returns zero at the end of file.
 */
auto read_chunk(llfio::file_handle &file,
                std::uint64_t offset,
                rw_dynblob buffer) noexcept -> result<std::size_t>;
auto write_all(llfio::file_handle &file,
               std::uint64_t offset,
               ro_dynblob data) noexcept -> result<void>;
auto sync_file(llfio::file_handle &file) noexcept -> result<void>;

/**
 * @brief Removes an incomplete output file, failures are ignored.
 */
void discard_file(std::string const &path) noexcept;

} // namespace pico::cli
