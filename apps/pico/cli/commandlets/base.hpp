#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <pico/container.hpp>
#include <pico/disappointment.hpp>

#include "pico/cli/error.hpp"
#include "pico/cli/transcode.hpp"

// fmt 9.0.0
#if FMT_VERSION >= 9'00'00
template <>
struct fmt::formatter<lyra::parser> : fmt::ostream_formatter
{
};
template <>
struct fmt::formatter<lyra::group> : fmt::ostream_formatter
{
};
#endif

namespace pico::cli
{

/**
 * @brief Options shared by all commandlets.
 */
struct global_options
{
public:
    bool verbose{false};
    bool debug{false};

    template <typename Parser>
    explicit global_options(Parser &cmd)
    {
        cmd.add_argument(lyra::opt(verbose)["-v"]["--verbose"].help(
                "Increase verbosity."));
        cmd.add_argument(lyra::opt(debug)["--debug"].help(
                "Print the full diagnostics of failures."));
    }

    /**
     * @brief Prints a progress line if --verbose has been given.
     */
    void trace(std::string_view action, std::string_view file) const;

    /**
     * @brief Reports the failure to process the given file on stderr.
     */
    void report(std::string_view file, pico_code const &failure) const;

    /**
     * @brief Runs fn for every file and reports each failure.
     */
    template <typename Fn>
    auto process_batch(std::vector<std::string> const &files, Fn &&fn) const
            -> cli_result<void>
    {
        return for_each_file(
                files, std::forward<Fn>(fn),
                [this](std::string_view file, pico_code const &failure)
                { report(file, failure); });
    }
};

// clang-format off
template <typename T>
concept commandlet
    = std::constructible_from<T, lyra::cli &, global_options &>
    && requires(T &&t, lyra::group const &g)
    {
        lyra::command(std::string(T::name), nullptr);
        { t.exec(g) } -> std::same_as<cli_result<void>>;
    };
// clang-format on

template <typename T>
struct commandlet_base
{
protected:
    lyra::command cmd;

    commandlet_base()
        : cmd(std::string(T::name),
              [self = static_cast<T *>(this)](lyra::group const &g)
              {
                  if (cli_result<void> rx = self->exec(g); rx.has_failure())
                  {
                      fmt::print(stderr, "Command execution failed: {}\n",
                                 rx.assume_error().message().c_str());

                      cli_code{cli_errc::exit_error}.throw_exception();
                  }
              })
    {
    }
};

} // namespace pico::cli
