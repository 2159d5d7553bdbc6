#include "pico/cli/utils.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

#include <boost/algorithm/hex.hpp>

#include <pico/format.hpp>

namespace pico::cli
{

auto hex_decode_key(std::string_view hexKey)
        -> cli_result<std::vector<std::byte>>
{
    std::string bytes;
    try
    {
        boost::algorithm::unhex(hexKey.begin(), hexKey.end(),
                                std::back_inserter(bytes));
    }
    catch (boost::algorithm::hex_decode_error const &)
    {
        return cli_errc::bad_hex_key;
    }
    if (bytes.empty() || bytes.size() > max_key_size)
    {
        return cli_errc::bad_key_size;
    }

    std::vector<std::byte> key(bytes.size());
    std::ranges::transform(bytes, key.begin(), [](char c) {
        return static_cast<std::byte>(c);
    });
    return key;
}

auto encoded_output_path(std::string_view input,
                         std::string_view suffix,
                         std::string_view extension) -> std::string
{
    std::string output(input);
    output.append(suffix);
    output.append(extension);
    return output;
}

auto decoded_output_path(std::string_view input,
                         std::string_view suffix,
                         std::string_view extension) -> std::string
{
    if (input.size() > default_encoded_extension.size()
        && input.ends_with(default_encoded_extension))
    {
        input.remove_suffix(default_encoded_extension.size());
    }
    std::string output(input);
    output.append(suffix);
    output.append(extension);
    return output;
}

auto open_input_file(std::string const &path) noexcept
        -> result<llfio::file_handle>
{
    auto fileRx = llfio::file({}, path, llfio::file_handle::mode::read,
                              llfio::file_handle::creation::open_existing);
    if (fileRx.has_error())
    {
        auto const kind = fileRx.assume_error()
                                  == system_error::errc::no_such_file_or_directory
                                ? pico_errc::store_not_found
                                : pico_errc::read_failed;
        return make_io_error(kind, io_site::store_open, fileRx.assume_error());
    }
    return std::move(fileRx).assume_value();
}

auto create_output_file(std::string const &path) noexcept
        -> result<llfio::file_handle>
{
    auto fileRx = llfio::file({}, path, llfio::file_handle::mode::write,
                              llfio::file_handle::creation::only_if_not_exist);
    if (fileRx.has_error())
    {
        auto const kind = fileRx.assume_error() == system_error::errc::file_exists
                                ? pico_errc::store_already_exists
                                : pico_errc::write_failed;
        return make_io_error(kind, io_site::store_create,
                             fileRx.assume_error());
    }
    return std::move(fileRx).assume_value();
}

auto read_chunk(llfio::file_handle &file,
                std::uint64_t offset,
                rw_dynblob buffer) noexcept -> result<std::size_t>
{
    llfio::file_handle::buffer_type requestBuffers[] = {buffer};
    auto readRx = file.read({requestBuffers, offset});
    if (readRx.has_error())
    {
        return make_io_error(pico_errc::read_failed, io_site::plain_read,
                             readRx.assume_error());
    }
    auto const numRead = readRx.bytes_transferred();
    if (numRead != 0U && readRx.assume_value()[0].data() != buffer.data())
    {
        std::memcpy(buffer.data(), readRx.assume_value()[0].data(), numRead);
    }
    return numRead;
}

auto write_all(llfio::file_handle &file,
               std::uint64_t offset,
               ro_dynblob data) noexcept -> result<void>
{
    while (!data.empty())
    {
        llfio::file_handle::const_buffer_type requestBuffers[]
                = {{data.data(), data.size()}};
        auto writeRx = file.write({requestBuffers, offset});
        if (writeRx.has_error())
        {
            return make_io_error(pico_errc::write_failed,
                                 io_site::plain_write, writeRx.assume_error());
        }
        auto const numWritten = writeRx.bytes_transferred();
        if (numWritten == 0U)
        {
            return make_io_error(pico_errc::write_failed,
                                 io_site::plain_write,
                                 system_error::errc::io_error);
        }
        offset += numWritten;
        data = data.subspan(numWritten);
    }
    return oc::success();
}

auto sync_file(llfio::file_handle &file) noexcept -> result<void>
{
    if (auto barrierRx = file.barrier(); barrierRx.has_error())
    {
        return make_io_error(pico_errc::write_failed, io_site::plain_sync,
                             barrierRx.assume_error());
    }
    return oc::success();
}

void discard_file(std::string const &path) noexcept
{
    auto fileRx = llfio::file({}, path, llfio::file_handle::mode::write,
                              llfio::file_handle::creation::open_existing);
    if (fileRx.has_value())
    {
        (void)fileRx.assume_value().unlink();
    }
}

} // namespace pico::cli
