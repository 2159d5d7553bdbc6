#pragma once

#include <memory>
#include <type_traits>

#include <pico/disappointment.hpp>
#include <pico/format.hpp>
#include <pico/span.hpp>

namespace pico::crypto
{

/**
 * A streaming message digest producing the 128 bit content hash.
 */
class digest_context
{
public:
    virtual ~digest_context() noexcept = default;

    [[nodiscard]] virtual auto update(ro_dynblob data) noexcept
            -> result<void>
            = 0;
    [[nodiscard]] virtual auto final(rw_blob<digest_size> digest) noexcept
            -> result<void>
            = 0;

protected:
    digest_context() noexcept = default;
    digest_context(digest_context const &) = default;
    auto operator=(digest_context const &) -> digest_context & = default;
};

class crypto_provider
{
public:
    [[nodiscard]] virtual auto create_digest() const noexcept
            -> result<std::unique_ptr<digest_context>>
            = 0;

    /**
     * calculates cryptographically save random bytes
     */
    [[nodiscard]] virtual auto random_bytes(rw_dynblob out) const noexcept
            -> result<void>
            = 0;

protected:
    constexpr crypto_provider() noexcept = default;
    constexpr ~crypto_provider() noexcept = default;

    crypto_provider(crypto_provider const &) = delete;
    auto operator=(crypto_provider const &) -> crypto_provider & = delete;
};
static_assert(!std::is_copy_constructible_v<crypto_provider>);
static_assert(!std::is_move_constructible_v<crypto_provider>);
static_assert(!std::is_copy_assignable_v<crypto_provider>);
static_assert(!std::is_move_assignable_v<crypto_provider>);
static_assert(!std::is_destructible_v<crypto_provider>);

/**
 * Returns the process wide provider computing MD5 digests with the
 * OpenSSL EVP interface.
 */
auto openssl_md5_crypto_provider() noexcept -> crypto_provider *;

} // namespace pico::crypto
