#include "pico/cli/commandlets/header.hpp"

#include <new>

#include <fmt/core.h>

#include <pico/container.hpp>

namespace pico::cli
{

auto header::exec(lyra::group const &) const -> cli_result<void>
{
    auto const format = parse_header_format(mFormat);
    if (!format)
    {
        return cli_errc::unknown_header_format;
    }

    return mOptions.process_batch(mFiles, [&](std::string const &input)
                                  { return print_header(input, *format); });
}

auto header::print_header(std::string const &input, header_format format) const
        -> result<void>
{
    mOptions.trace("Reading", input);
    PICO_TRY(auto &&picoFile, container::open({}, input));

    std::string rendered;
    try
    {
        rendered = format_header(summarize(picoFile), format);
    }
    catch (std::bad_alloc const &)
    {
        return make_error(pico_errc::internal_error);
    }
    fmt::print("Pico header as {} for: {}\n{}", to_string(format), input,
               rendered);
    return oc::success();
}

} // namespace pico::cli
