#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <lyra/lyra.hpp>

#include <pico/header_format.hpp>

#include "pico/cli/commandlets/base.hpp"
#include "pico/cli/error.hpp"

namespace pico::cli
{

class header : public commandlet_base<header>
{
    global_options &mOptions;
    std::string mFormat;
    std::vector<std::string> mFiles;

public:
    header(lyra::cli &parser, global_options &options)
        : commandlet_base<header>()
        , mOptions(options)
        , mFormat("dict")
        , mFiles()
    {
        cmd.help("print the headers of pico containers");
        cmd.add_argument(lyra::opt(mFormat, "format")["--format"].help(
                "One of dict, json, yaml or xml."));

        cmd.add_argument(lyra::literal("--"));
        cmd.add_argument(lyra::arg(mFiles, "file").required());

        parser |= cmd;
    }
    static constexpr std::string_view name = "header";

    auto exec(lyra::group const &) const -> cli_result<void>;

private:
    auto print_header(std::string const &input, header_format format) const
            -> result<void>;
};

} // namespace pico::cli
