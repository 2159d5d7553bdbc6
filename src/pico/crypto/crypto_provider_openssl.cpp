#include "crypto_provider_openssl.hpp"

#include "../platform/sysrandom.hpp"

namespace pico::crypto::detail
{
auto openssl_md5_digest::update(ro_dynblob data) noexcept -> result<void>
{
    return mState.update(data);
}

auto openssl_md5_digest::final(rw_blob<digest_size> digest) noexcept
        -> result<void>
{
    return mState.final(digest);
}

auto openssl_md5_provider::create_digest() const noexcept
        -> result<std::unique_ptr<digest_context>>
{
    auto digest = make_unique_nothrow<openssl_md5_digest>();
    if (!digest)
    {
        return make_error(pico_errc::hash_error);
    }
    PICO_TRY(digest->init());

    return std::unique_ptr<digest_context>(std::move(digest));
}

auto openssl_md5_provider::random_bytes(rw_dynblob out) const noexcept
        -> result<void>
{
    return pico::detail::random_bytes(out);
}
} // namespace pico::crypto::detail

namespace pico::crypto
{
namespace
{
detail::openssl_md5_provider openssl_md5;
}

auto openssl_md5_crypto_provider() noexcept -> crypto_provider *
{
    return &openssl_md5;
}
} // namespace pico::crypto
