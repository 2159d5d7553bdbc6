#include "md5.hpp"

#include <openssl/err.h>

namespace pico::crypto::detail
{

md5::~md5() noexcept
{
    if (mCtx != nullptr)
    {
        EVP_MD_CTX_free(mCtx);
    }
}

auto md5::init() noexcept -> result<void>
{
    if (mCtx == nullptr)
    {
        mCtx = EVP_MD_CTX_new();
        if (mCtx == nullptr)
        {
            return make_error(pico_errc::hash_error);
        }
    }
    if (EVP_DigestInit_ex(mCtx, EVP_md5(), nullptr) != 1)
    {
        ERR_clear_error();
        return make_error(pico_errc::hash_error);
    }
    return outcome::success();
}

auto md5::update(ro_dynblob data) noexcept -> result<void>
{
    if (mCtx == nullptr)
    {
        return make_error(pico_errc::internal_error);
    }
    if (data.empty())
    {
        return outcome::success();
    }
    if (EVP_DigestUpdate(mCtx, data.data(), data.size()) != 1)
    {
        ERR_clear_error();
        return make_error(pico_errc::hash_error);
    }
    return outcome::success();
}

auto md5::final(rw_blob<digest_bytes> digest) noexcept -> result<void>
{
    if (mCtx == nullptr)
    {
        return make_error(pico_errc::internal_error);
    }
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(mCtx, reinterpret_cast<unsigned char *>(digest.data()),
                           &written)
                != 1
        || written != digest_bytes)
    {
        ERR_clear_error();
        return make_error(pico_errc::hash_error);
    }
    return outcome::success();
}

} // namespace pico::crypto::detail
