#include "pico/cli/commandlets/encode.hpp"

#include <pico/format.hpp>

namespace pico::cli
{

auto encode::exec(lyra::group const &) const -> cli_result<void>
{
    std::vector<std::byte> fixedKey;
    if (mHasKey)
    {
        PICO_TRY(fixedKey, hex_decode_key(mHexKey));
    }
    else if (mKeyLength == 0U || mKeyLength > max_key_size)
    {
        return cli_errc::bad_key_size;
    }

    return mOptions.process_batch(
            mFiles,
            [&](std::string const &input)
            {
                mOptions.trace("Encoding", input);
                return encode_file(
                        input, encoded_output_path(input, mSuffix, mExtension),
                        fixedKey, mKeyLength, mMetadataLength);
            });
}

} // namespace pico::cli
