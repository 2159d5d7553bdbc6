#include <ranges>

#include <boost/predef/compiler.h>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include "pico/cli/commandlets/decode.hpp"
#include "pico/cli/commandlets/encode.hpp"
#include "pico/cli/commandlets/header.hpp"

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic ignored "-Wmissing-declarations"
#endif

// fmt 9.0.0
#if FMT_VERSION >= 9'00'00
template <>
struct fmt::formatter<lyra::cli> : fmt::ostream_formatter
{
};
#endif

namespace pico::cli
{

static_assert(commandlet<encode>);
static_assert(commandlet<decode>);
static_assert(commandlet<header>);

auto main(lyra::args args) -> int
{
    lyra::cli cli;
    bool showHelp = false;

    cli |= lyra::help(showHelp);

    global_options options(cli);

    encode encode(cli, options);
    decode decode(cli, options);
    header header(cli, options);

    try
    {
        auto parseResult = cli.parse(args);
        if (showHelp || std::ranges::ssize(args) < 2)
        {
            fmt::print("{}\n", cli);
        }
        else if (!parseResult.is_ok())
        {
            fmt::print(stderr, "Failed to parse the cli args: {}\n{}",
                       parseResult.message(), cli);
            return 1;
        }
    }
    catch (cli_error const &exc)
    {
        if (exc.code() == cli_errc::exit_error)
        {
            // error message already printed
            return 1;
        }
        fmt::print(stderr, "Command failed unexpectedly: {}\n", exc.what());
        return 1;
    }
    catch (system_error::status_error<void> const &exc)
    {
        fmt::print(stderr, "Command failed unexpectedly: {}\n", exc.what());
        return 1;
    }
    return 0;
}

} // namespace pico::cli

auto main(int argc, char *argv[]) -> int
{
    return pico::cli::main(lyra::args(argc, argv));
}
