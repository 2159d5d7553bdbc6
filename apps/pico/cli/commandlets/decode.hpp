#pragma once

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

class decode : public commandlet_base<decode>
{
    global_options &mOptions;
    std::string mExtension;
    std::string mSuffix;
    std::vector<std::string> mFiles;

public:
    decode(lyra::cli &parser, global_options &options)
        : commandlet_base<decode>()
        , mOptions(options)
        , mExtension(default_decoded_extension)
        , mSuffix()
        , mFiles()
    {
        cmd.help("decode pico containers into plain files");
        cmd.add_argument(lyra::opt(mExtension, "ext")["--extension"].help(
                "The extension appended to the decoded files."));
        cmd.add_argument(lyra::opt(mSuffix, "suffix")["--suffix"].help(
                "A suffix inserted before the extension."));

        cmd.add_argument(lyra::literal("--"));
        cmd.add_argument(lyra::arg(mFiles, "file").required());

        parser |= cmd;
    }
    static constexpr std::string_view name = "decode";

    auto exec(lyra::group const &) const -> cli_result<void>;
};

} // namespace pico::cli
