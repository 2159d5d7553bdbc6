#pragma once

#include <cstddef>
#include <cstdint>

#include <vector>

#include <pico/content_hash.hpp>
#include <pico/crypto/provider.hpp>
#include <pico/disappointment.hpp>
#include <pico/format.hpp>
#include <pico/llfio.hpp>
#include <pico/span.hpp>

namespace pico
{

/**
 * A pico encoded file.
 *
 * The store consists of a big endian header (magic, version, data offset,
 * content hash, key), an unencrypted metadata region which extends up to
 * the data offset and the encrypted data region which extends up to the
 * end of the store.
 *
 * The content hash is lazily maintained: every put() invalidates it and
 * only flush() recomputes it. A container is not safe for concurrent use.
 */
class container
{
public:
    container(container const &) = delete;
    container(container &&) noexcept = default;
    auto operator=(container const &) -> container & = delete;
    auto operator=(container &&) noexcept -> container & = default;
    ~container() noexcept = default;

    /**
     * Initializes an empty container with the given key and reserves
     * reservedMetadataLength bytes for metadata. The header is written and
     * the store flushed immediately, the content hash is left invalid.
     *
     * The store is expected to be empty.
     */
    static auto create(llfio::file_handle store,
                       ro_dynblob key,
                       std::uint32_t reservedMetadataLength,
                       crypto::crypto_provider *cryptoProvider
                       = crypto::openssl_md5_crypto_provider()) noexcept
            -> result<container>;
    /**
     * Creates a new file at the given location and initializes it like
     * create() above. Fails with store_already_exists if the file exists.
     */
    static auto create(llfio::path_handle const &base,
                       llfio::path_view path,
                       ro_dynblob key,
                       std::uint32_t reservedMetadataLength,
                       crypto::crypto_provider *cryptoProvider
                       = crypto::openssl_md5_crypto_provider()) noexcept
            -> result<container>;

    /**
     * Parses and validates the header of the store. The stored content
     * hash is trusted and not verified.
     */
    static auto open(llfio::file_handle store,
                     crypto::crypto_provider *cryptoProvider
                     = crypto::openssl_md5_crypto_provider()) noexcept
            -> result<container>;
    static auto open(llfio::path_handle const &base,
                     llfio::path_view path,
                     crypto::crypto_provider *cryptoProvider
                     = crypto::openssl_md5_crypto_provider()) noexcept
            -> result<container>;

    /**
     * Reads metadata starting at start bytes into the metadata region.
     * Reads are clamped to the metadata region, reading at or past its
     * end yields zero bytes.
     */
    auto get_metadata(std::uint32_t start, rw_dynblob buffer) noexcept
            -> result<std::size_t>;
    /**
     * Writes metadata, the write is truncated at the end of the metadata
     * region. Does not affect the content hash.
     */
    auto put_metadata(std::uint32_t start, ro_dynblob buffer) noexcept
            -> result<std::size_t>;

    /**
     * Reads and decrypts data at the given position of the data region.
     * Returns the number of bytes read which is zero at the end of data.
     */
    auto get(std::uint64_t position, rw_dynblob buffer) noexcept
            -> result<std::size_t>;
    /**
     * Encrypts the buffer in place and writes it to the given position of
     * the data region. Invalidates the content hash.
     */
    auto put(std::uint64_t position, rw_dynblob buffer) noexcept
            -> result<std::size_t>;

    /**
     * Recomputes the content hash if necessary, rewrites the header and
     * flushes the store.
     */
    auto flush() noexcept -> result<void>;

    auto version() const noexcept -> format_version
    {
        return mVersion;
    }
    auto offset() const noexcept -> std::uint32_t
    {
        return mDataOffset;
    }
    //! The cached content hash, only meaningful if hash_state() is valid.
    auto hash() const noexcept -> content_digest const &
    {
        return mHash.digest();
    }
    auto hash_state() const noexcept -> content_hash::state
    {
        return mHash.get();
    }
    auto key() const noexcept -> ro_dynblob
    {
        return mKey;
    }
    auto metadata_start() const noexcept -> std::size_t
    {
        return header_fixed_size + mKey.size();
    }
    auto metadata_length() const noexcept -> std::uint32_t
    {
        return static_cast<std::uint32_t>(mDataOffset - metadata_start());
    }

private:
    container(llfio::file_handle store,
              crypto::crypto_provider *cryptoProvider,
              format_version version,
              std::uint32_t dataOffset,
              std::vector<std::byte> key,
              content_hash hash) noexcept;

    auto recompute_hash() noexcept -> result<void>;
    auto write_header() noexcept -> result<void>;
    auto sync(io_site site) noexcept -> result<void>;

    llfio::file_handle mStore;
    crypto::crypto_provider *mCryptoProvider;
    format_version mVersion;
    std::uint32_t mDataOffset;
    std::vector<std::byte> mKey;
    content_hash mHash;
};

} // namespace pico
