#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <lyra/lyra.hpp>

#include "pico/cli/commandlets/base.hpp"
#include "pico/cli/error.hpp"
#include "pico/cli/transcode.hpp"
#include "pico/cli/utils.hpp"

namespace pico::cli
{

class encode : public commandlet_base<encode>
{
    global_options &mOptions;
    std::string mHexKey;
    bool mHasKey;
    std::uint32_t mKeyLength;
    std::uint32_t mMetadataLength;
    std::string mExtension;
    std::string mSuffix;
    std::vector<std::string> mFiles;

public:
    encode(lyra::cli &parser, global_options &options)
        : commandlet_base<encode>()
        , mOptions(options)
        , mHexKey()
        , mHasKey(false)
        , mKeyLength(8U)
        , mMetadataLength(0U)
        , mExtension(default_encoded_extension)
        , mSuffix()
        , mFiles()
    {
        cmd.help("encode files into pico containers");
        auto const keyParser = [this](std::string const &hexKey)
        {
            mHexKey = hexKey;
            mHasKey = true;
        };
        cmd.add_argument(lyra::opt(keyParser, "hex")["--key"].help(
                "The key as hex digits, e.g. 5521E49A. A random key is "
                "generated for each file if omitted."));
        cmd.add_argument(lyra::opt(mKeyLength, "bytes")["--key-length"].help(
                "The length of the generated random keys."));
        cmd.add_argument(
                lyra::opt(mMetadataLength, "bytes")["--metadata-length"].help(
                        "The number of metadata bytes to reserve."));
        cmd.add_argument(lyra::opt(mExtension, "ext")["--extension"].help(
                "The extension appended to the encoded files."));
        cmd.add_argument(lyra::opt(mSuffix, "suffix")["--suffix"].help(
                "A suffix inserted before the extension."));

        cmd.add_argument(lyra::literal("--"));
        cmd.add_argument(lyra::arg(mFiles, "file").required());

        parser |= cmd;
    }
    static constexpr std::string_view name = "encode";

    auto exec(lyra::group const &) const -> cli_result<void>;
};

} // namespace pico::cli
