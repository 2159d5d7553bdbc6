#include "pico/cli/commandlets/decode.hpp"

namespace pico::cli
{

auto decode::exec(lyra::group const &) const -> cli_result<void>
{
    return mOptions.process_batch(
            mFiles,
            [this](std::string const &input)
            {
                mOptions.trace("Decoding", input);
                return decode_file(
                        input, decoded_output_path(input, mSuffix, mExtension));
            });
}

} // namespace pico::cli
