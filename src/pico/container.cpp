#include <pico/container.hpp>

#include <cstring>

#include <algorithm>
#include <array>
#include <limits>
#include <new>
#include <utility>

#include <pico/crypt.hpp>
#include <pico/utils/binary_codec.hpp>

#include "detail/header_codec.hpp"

namespace pico
{

namespace
{

// llfio maps positions onto off_t
constexpr std::uint64_t max_store_position
        = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

auto store_position(std::uint64_t base,
                    std::uint64_t position,
                    io_site site) noexcept -> result<std::uint64_t>
{
    if (base > max_store_position || position > max_store_position - base)
    {
        return make_io_error(pico_errc::seek_failed, site,
                             system_error::errc::value_too_large);
    }
    return base + position;
}

/**
 * Reads until the buffer is full or the end of the store has been reached.
 */
auto read_store(llfio::file_handle &store,
                std::uint64_t offset,
                rw_dynblob buffer,
                io_site site) noexcept -> result<std::size_t>
{
    std::size_t numRead = 0;
    while (!buffer.empty())
    {
        llfio::file_handle::buffer_type reqBuffers[]
                = {{buffer.data(), buffer.size()}};

        auto readRx = store.read({reqBuffers, offset + numRead});
        if (readRx.has_error())
        {
            return make_io_error(pico_errc::read_failed, site,
                                 readRx.assume_error());
        }
        auto const buffers = std::move(readRx).assume_value();
        if (buffers.empty() || buffers[0].size() == 0U)
        {
            break;
        }
        auto const chunk = buffers[0].size();
        if (buffers[0].data() != buffer.data())
        {
            std::memcpy(buffer.data(), buffers[0].data(), chunk);
        }
        numRead += chunk;
        buffer = buffer.subspan(chunk);
    }
    return numRead;
}

auto write_store(llfio::file_handle &store,
                 std::uint64_t offset,
                 ro_dynblob data,
                 io_site site) noexcept -> result<std::size_t>
{
    std::size_t numWritten = 0;
    while (!data.empty())
    {
        llfio::file_handle::const_buffer_type reqBuffers[]
                = {{data.data(), data.size()}};

        auto writeRx = store.write({reqBuffers, offset + numWritten});
        if (writeRx.has_error())
        {
            return make_io_error(pico_errc::write_failed, site,
                                 writeRx.assume_error());
        }
        auto const buffers = std::move(writeRx).assume_value();
        if (buffers.empty() || buffers[0].size() == 0U)
        {
            return make_io_error(pico_errc::write_failed, site,
                                 system_error::errc::io_error);
        }
        auto const chunk = buffers[0].size();
        numWritten += chunk;
        data = data.subspan(chunk);
    }
    return numWritten;
}

} // namespace

container::container(llfio::file_handle store,
                     crypto::crypto_provider *cryptoProvider,
                     format_version version,
                     std::uint32_t dataOffset,
                     std::vector<std::byte> key,
                     content_hash hash) noexcept
    : mStore(std::move(store))
    , mCryptoProvider(cryptoProvider)
    , mVersion(version)
    , mDataOffset(dataOffset)
    , mKey(std::move(key))
    , mHash(hash)
{
}

auto container::create(llfio::file_handle store,
                       ro_dynblob key,
                       std::uint32_t reservedMetadataLength,
                       crypto::crypto_provider *cryptoProvider) noexcept
        -> result<container>
{
    if (key.empty() || key.size() > max_key_size)
    {
        return make_error(pico_errc::key_error);
    }
    if (cryptoProvider == nullptr)
    {
        return make_error(pico_errc::internal_error);
    }

    auto const metadataStart = header_fixed_size + key.size();
    auto const dataOffset
            = static_cast<std::uint64_t>(metadataStart) + reservedMetadataLength;
    if (dataOffset > std::numeric_limits<std::uint32_t>::max())
    {
        return make_error(pico_errc::bad_offset);
    }

    std::vector<std::byte> ownedKey;
    try
    {
        ownedKey.assign(key.begin(), key.end());
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }

    container self(std::move(store), cryptoProvider, supported_version,
                   static_cast<std::uint32_t>(dataOffset), std::move(ownedKey),
                   content_hash{});

    PICO_TRY(self.write_header());
    PICO_TRY(self.sync(io_site::create_sync));

    return self;
}

auto container::create(llfio::path_handle const &base,
                       llfio::path_view path,
                       ro_dynblob key,
                       std::uint32_t reservedMetadataLength,
                       crypto::crypto_provider *cryptoProvider) noexcept
        -> result<container>
{
    auto fileRx = llfio::file(base, path, llfio::file_handle::mode::write,
                              llfio::file_handle::creation::only_if_not_exist);
    if (fileRx.has_error())
    {
        if (fileRx.assume_error() == system_error::errc::file_exists)
        {
            return make_io_error(pico_errc::store_already_exists,
                                 io_site::store_create, fileRx.assume_error());
        }
        return make_io_error(pico_errc::write_failed, io_site::store_create,
                             fileRx.assume_error());
    }
    auto &&fileHandle = std::move(fileRx).assume_value();

    auto clonedRx = fileHandle.reopen();
    if (clonedRx.has_error())
    {
        return make_io_error(pico_errc::write_failed, io_site::store_create,
                             clonedRx.assume_error());
    }
    auto &&clonedHandle = std::move(clonedRx).assume_value();

    if (auto createRx = container::create(std::move(fileHandle), key,
                                          reservedMetadataLength,
                                          cryptoProvider))
    {
        return std::move(createRx).assume_value();
    }
    else
    {
        // don't leave a half initialized container behind
        (void)clonedHandle.unlink();
        return std::move(createRx).assume_error();
    }
}

auto container::open(llfio::file_handle store,
                     crypto::crypto_provider *cryptoProvider) noexcept
        -> result<container>
{
    using detail::header_codec;

    if (cryptoProvider == nullptr)
    {
        return make_error(pico_errc::internal_error);
    }

    std::array<std::byte, header_fixed_size> prefixBytes{};
    PICO_TRY(auto const prefixSize,
             read_store(store, 0U, prefixBytes, io_site::header_prefix_read));
    if (prefixSize < header_fixed_size)
    {
        // a foreign file is reported before a truncated header
        auto const magic = load_primitive<std::uint16_t>(
                ro_blob<header_fixed_size>(prefixBytes), magic_position);
        if (magic != magic_number)
        {
            return make_not_pico_error(magic);
        }
        return make_io_error(pico_errc::read_failed,
                             io_site::header_prefix_read,
                             system_error::errc::bad_message);
    }

    PICO_TRY(auto const prefix, header_codec::decode_prefix(prefixBytes));

    std::vector<std::byte> keyBytes;
    try
    {
        keyBytes.resize(prefix.key_length);
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }
    PICO_TRY(auto const keySize, read_store(store, key_position, keyBytes,
                                            io_site::header_key_read));
    if (keySize < keyBytes.size())
    {
        return make_io_error(pico_errc::read_failed, io_site::header_key_read,
                             system_error::errc::bad_message);
    }

    PICO_TRY(auto &&fields, header_codec::decode(prefix, keyBytes));

    return container(std::move(store), cryptoProvider, fields.version,
                     fields.data_offset, std::move(fields.key),
                     content_hash{fields.hash});
}

auto container::open(llfio::path_handle const &base,
                     llfio::path_view path,
                     crypto::crypto_provider *cryptoProvider) noexcept
        -> result<container>
{
    auto fileRx
            = llfio::file(base, path, llfio::file_handle::mode::write,
                          llfio::file_handle::creation::open_existing);
    if (fileRx.has_error())
    {
        if (fileRx.assume_error()
            == system_error::errc::no_such_file_or_directory)
        {
            return make_io_error(pico_errc::store_not_found,
                                 io_site::store_open, fileRx.assume_error());
        }
        return make_io_error(pico_errc::read_failed, io_site::store_open,
                             fileRx.assume_error());
    }
    return container::open(std::move(fileRx).assume_value(), cryptoProvider);
}

auto container::get_metadata(std::uint32_t start, rw_dynblob buffer) noexcept
        -> result<std::size_t>
{
    auto const length = metadata_length();
    if (length == 0U || start >= length)
    {
        return 0U;
    }
    auto const window = std::min<std::size_t>(buffer.size(), length - start);

    PICO_TRY(auto const storeOffset, store_position(metadata_start(), start,
                                               io_site::metadata_read_seek));
    return read_store(mStore, storeOffset, buffer.first(window),
                      io_site::metadata_read);
}

auto container::put_metadata(std::uint32_t start, ro_dynblob buffer) noexcept
        -> result<std::size_t>
{
    auto const length = metadata_length();
    if (length == 0U || start >= length)
    {
        return 0U;
    }
    auto const window = std::min<std::size_t>(buffer.size(), length - start);

    PICO_TRY(auto const storeOffset, store_position(metadata_start(), start,
                                               io_site::metadata_write_seek));
    return write_store(mStore, storeOffset, buffer.first(window),
                       io_site::metadata_write);
}

auto container::get(std::uint64_t position, rw_dynblob buffer) noexcept
        -> result<std::size_t>
{
    PICO_TRY(auto const storeOffset, store_position(mDataOffset, position,
                                               io_site::data_read_seek));
    PICO_TRY(auto const numRead,
             read_store(mStore, storeOffset, buffer, io_site::data_read));

    crypt(position, buffer.first(numRead), mKey);
    return numRead;
}

auto container::put(std::uint64_t position, rw_dynblob buffer) noexcept
        -> result<std::size_t>
{
    PICO_TRY(auto const storeOffset, store_position(mDataOffset, position,
                                               io_site::data_write_seek));

    crypt(position, buffer, mKey);
    // the store may have been modified even if the write fails
    mHash.invalidate();

    return write_store(mStore, storeOffset, buffer, io_site::data_write);
}

auto container::flush() noexcept -> result<void>
{
    PICO_TRY(recompute_hash());
    PICO_TRY(write_header());
    return sync(io_site::flush_sync);
}

auto container::recompute_hash() noexcept -> result<void>
{
    return mHash.recompute(
            *mCryptoProvider,
            [this](std::uint64_t position, rw_dynblob buffer) noexcept
            -> result<std::size_t> { return get(position, buffer); });
}

auto container::write_header() noexcept -> result<void>
{
    using detail::header_codec;

    detail::header_fields fields{
            .version = mVersion,
            .data_offset = mDataOffset,
            .hash = mHash.digest(),
            .key = {},
    };

    std::vector<std::byte> headerBytes;
    try
    {
        fields.key = mKey;
        headerBytes.resize(header_codec::size_of(fields));
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }
    PICO_TRY(header_codec::encode(headerBytes, fields));

    PICO_TRY(write_store(mStore, 0U, headerBytes, io_site::header_write));
    return outcome::success();
}

auto container::sync(io_site site) noexcept -> result<void>
{
    if (auto barrierRx = mStore.barrier(); barrierRx.has_error())
    {
        return make_io_error(pico_errc::write_failed, site,
                             barrierRx.assume_error());
    }
    return outcome::success();
}

} // namespace pico
