#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <pico/crypto/provider.hpp>
#include <pico/disappointment.hpp>
#include <pico/span.hpp>

#include "pico/cli/error.hpp"

namespace pico::cli
{

/**
 * @brief Applies fn to every file and keeps going after failures which
 * are handed to report one by one.
 *
 * @return batch_failed if at least one file couldn't be processed
 */
template <typename Fn, typename Report>
auto for_each_file(std::vector<std::string> const &files,
                   Fn &&fn,
                   Report &&report) -> cli_result<void>
{
    std::size_t numFailed = 0;
    for (auto const &file : files)
    {
        if (result<void> rx = fn(file); rx.has_failure())
        {
            report(std::string_view(file), rx.assume_error());
            ++numFailed;
        }
    }
    if (numFailed != 0U)
    {
        return cli_errc::batch_failed;
    }
    return oc::success();
}

/**
 * @brief Streams the plain input file into a new pico container at output.
 *
 * If key is empty a random key of randomKeyLength bytes is drawn from the
 * crypto provider. The output is removed again if anything fails, an
 * existing output is left alone.
 */
auto encode_file(std::string const &input,
                 std::string const &output,
                 ro_dynblob key,
                 std::uint32_t randomKeyLength,
                 std::uint32_t metadataLength,
                 crypto::crypto_provider *cryptoProvider
                 = crypto::openssl_md5_crypto_provider()) noexcept
        -> result<void>;

/**
 * @brief Streams the data region of the pico container at input into a
 * new plain file at output which is removed again if anything fails.
 */
auto decode_file(std::string const &input, std::string const &output) noexcept
        -> result<void>;

} // namespace pico::cli
