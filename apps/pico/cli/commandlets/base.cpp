#include "pico/cli/commandlets/base.hpp"

namespace pico::cli
{

void global_options::trace(std::string_view action,
                           std::string_view file) const
{
    if (verbose)
    {
        fmt::print("{} {}...\n", action, file);
    }
}

void global_options::report(std::string_view file,
                            pico_code const &failure) const
{
    if (debug)
    {
        fmt::print(stderr, "{}: {}\n", file, failure);
    }
    else
    {
        fmt::print(stderr, "{}: {}\n", file, failure.message().c_str());
    }
}

} // namespace pico::cli
