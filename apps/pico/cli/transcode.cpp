#include "pico/cli/transcode.hpp"

#include <new>

#include <pico/container.hpp>
#include <pico/format.hpp>
#include <pico/utils/misc.hpp>

#include "pico/cli/utils.hpp"

namespace pico::cli
{

auto encode_file(std::string const &input,
                 std::string const &output,
                 ro_dynblob key,
                 std::uint32_t randomKeyLength,
                 std::uint32_t metadataLength,
                 crypto::crypto_provider *cryptoProvider) noexcept
        -> result<void>
{
    if (cryptoProvider == nullptr)
    {
        return make_error(pico_errc::internal_error);
    }

    std::vector<std::byte> randomKey;
    std::vector<std::byte> buffer;
    try
    {
        if (key.empty())
        {
            randomKey.resize(randomKeyLength);
        }
        buffer.resize(chunk_size);
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }
    if (key.empty())
    {
        PICO_TRY(cryptoProvider->random_bytes(randomKey));
        key = randomKey;
    }

    PICO_TRY(auto &&source, open_input_file(input));
    PICO_TRY(auto &&target, container::create({}, output, key, metadataLength,
                                              cryptoProvider));
    bool completed = false;
    PICO_SCOPE_EXIT
    {
        if (!completed)
        {
            discard_file(output);
        }
    };

    std::uint64_t position = 0U;
    for (;;)
    {
        PICO_TRY(auto const numRead, read_chunk(source, position, buffer));
        if (numRead == 0U)
        {
            break;
        }
        PICO_TRY(target.put(position, rw_dynblob(buffer).first(numRead)));
        position += numRead;
    }
    PICO_TRY(target.flush());
    completed = true;
    return oc::success();
}

auto decode_file(std::string const &input, std::string const &output) noexcept
        -> result<void>
{
    std::vector<std::byte> buffer;
    try
    {
        buffer.resize(chunk_size);
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }

    PICO_TRY(auto &&source, container::open({}, input));
    PICO_TRY(auto &&target, create_output_file(output));
    bool completed = false;
    PICO_SCOPE_EXIT
    {
        if (!completed)
        {
            (void)target.unlink();
        }
    };

    std::uint64_t position = 0U;
    for (;;)
    {
        PICO_TRY(auto const numRead, source.get(position, buffer));
        if (numRead == 0U)
        {
            break;
        }
        PICO_TRY(write_all(target, position,
                           ro_dynblob(buffer).first(numRead)));
        position += numRead;
    }
    PICO_TRY(sync_file(target));
    completed = true;
    return oc::success();
}

} // namespace pico::cli
