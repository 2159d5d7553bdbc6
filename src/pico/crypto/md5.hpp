#pragma once

#include <utility>

#include <openssl/evp.h>

#include <pico/disappointment.hpp>
#include <pico/format.hpp>
#include <pico/span.hpp>

namespace pico::crypto::detail
{

/**
 * Incremental MD5 computation on top of an EVP_MD_CTX.
 */
class md5 final
{
public:
    static constexpr std::size_t digest_bytes = digest_size;

    md5() noexcept = default;
    ~md5() noexcept;

    md5(md5 const &) = delete;
    md5(md5 &&other) noexcept
        : mCtx(std::exchange(other.mCtx, nullptr))
    {
    }
    auto operator=(md5 const &) -> md5 & = delete;
    auto operator=(md5 &&other) noexcept -> md5 &
    {
        std::swap(mCtx, other.mCtx);
        return *this;
    }

    result<void> init() noexcept;
    result<void> update(ro_dynblob data) noexcept;
    result<void> final(rw_blob<digest_bytes> digest) noexcept;

private:
    EVP_MD_CTX *mCtx{nullptr};
};

} // namespace pico::crypto::detail
