#pragma once

#include <cstdint>

#include <array>
#include <concepts>
#include <utility>

#include <pico/crypto/provider.hpp>
#include <pico/disappointment.hpp>
#include <pico/format.hpp>
#include <pico/span.hpp>

namespace pico
{

/**
 * A positional reader over the decrypted data region. Returns the number of
 * bytes read, zero at the end of the data region.
 */
template <typename Fn>
concept data_reader = requires(Fn &&fn, std::uint64_t pos, rw_dynblob buf)
{
    { fn(pos, buf) } -> std::same_as<result<std::size_t>>;
};

/**
 * The cached content hash of a container together with its validity.
 *
 * The digest is only meaningful while the state is valid. Writes to the
 * data region invalidate it and only recompute() makes it valid again.
 */
class content_hash
{
public:
    enum class state
    {
        invalid,
        valid,
    };

    content_hash() noexcept
        : mDigest{}
        , mState(state::invalid)
    {
    }
    explicit content_hash(content_digest const &trusted) noexcept
        : mDigest(trusted)
        , mState(state::valid)
    {
    }

    auto digest() const noexcept -> content_digest const &
    {
        return mDigest;
    }
    auto get() const noexcept -> state
    {
        return mState;
    }
    auto is_valid() const noexcept -> bool
    {
        return mState == state::valid;
    }
    void invalidate() noexcept
    {
        mState = state::invalid;
    }

    /**
     * Streams the data region through a fresh digest if the hash is
     * invalid. Reads chunk_size bytes at a time until a read returns zero
     * bytes and feeds exactly the returned bytes into the digest.
     *
     * On failure the state remains invalid.
     */
    template <data_reader Reader>
    auto recompute(crypto::crypto_provider const &provider,
                   Reader &&read) noexcept -> result<void>
    {
        if (mState == state::valid)
        {
            return outcome::success();
        }

        auto digestRx = provider.create_digest();
        if (digestRx.has_error())
        {
            return make_error(pico_errc::hash_error);
        }
        auto digestCtx = std::move(digestRx).assume_value();

        std::array<std::byte, chunk_size> buffer;
        std::uint64_t position = 0;
        for (;;)
        {
            PICO_TRY(auto const numRead, read(position, rw_dynblob(buffer)));
            if (numRead == 0)
            {
                break;
            }
            if (digestCtx->update(ro_dynblob(buffer).first(numRead))
                        .has_error())
            {
                return make_error(pico_errc::hash_error);
            }
            position += numRead;
        }

        content_digest computed;
        if (digestCtx->final(computed).has_error())
        {
            return make_error(pico_errc::hash_error);
        }

        mDigest = computed;
        mState = state::valid;
        return outcome::success();
    }

private:
    content_digest mDigest;
    state mState;
};

} // namespace pico
