#pragma once

#include <pico/crypto/provider.hpp>
#include <pico/span.hpp>

#include "md5.hpp"

namespace pico::crypto::detail
{
class openssl_md5_digest final : public digest_context
{
public:
    openssl_md5_digest() noexcept = default;

    [[nodiscard]] auto init() noexcept -> result<void>
    {
        return mState.init();
    }

    [[nodiscard]] auto update(ro_dynblob data) noexcept
            -> result<void> override;
    [[nodiscard]] auto final(rw_blob<digest_size> digest) noexcept
            -> result<void> override;

private:
    md5 mState;
};

class openssl_md5_provider : public crypto_provider
{
    [[nodiscard]] auto create_digest() const noexcept
            -> result<std::unique_ptr<digest_context>> override;

    [[nodiscard]] auto random_bytes(rw_dynblob out) const noexcept
            -> result<void> override;

public:
    constexpr openssl_md5_provider() noexcept = default;
};
} // namespace pico::crypto::detail
