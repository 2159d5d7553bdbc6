#include <pico/disappointment.hpp>

#include <array>
#include <iterator>

namespace pico
{

auto generic_cause_of(system_error::status_code<void> const &code) noexcept
        -> system_error::errc
{
    using sys_errc = system_error::errc;

    // the conditions the cli and the tests care about
    constexpr std::array candidates{
            sys_errc::no_such_file_or_directory,
            sys_errc::file_exists,
            sys_errc::permission_denied,
            sys_errc::operation_not_permitted,
            sys_errc::is_a_directory,
            sys_errc::not_a_directory,
            sys_errc::read_only_file_system,
            sys_errc::no_space_on_device,
            sys_errc::file_too_large,
            sys_errc::value_too_large,
            sys_errc::bad_file_descriptor,
            sys_errc::invalid_argument,
            sys_errc::not_enough_memory,
            sys_errc::io_error,
    };

    if (code.empty() || code.success())
    {
        return sys_errc::success;
    }
    for (auto const candidate : candidates)
    {
        if (code.equivalent(
                    system_error::generic_code(system_error::in_place, candidate)))
        {
            return candidate;
        }
    }
    return sys_errc::unknown;
}

namespace
{

auto cause_message(system_error::errc cause) -> std::string
{
    auto const generic
            = system_error::generic_code(system_error::in_place, cause);
    auto const message = generic.message();
    return std::string(message.data(), message.size());
}

} // namespace

auto describe(pico_code const &code) -> std::string
{
    auto const &status = code.value();
    std::string description(pico_domain_type::map_to_message(status.kind));

    auto out = std::back_inserter(description);
    switch (status.kind)
    {
    case pico_errc::not_pico:
        fmt::format_to(out, " First bytes are 0x{:04X} instead of 0x{:04X}, "
                            "as required.",
                       status.observed, magic_number);
        break;

    case pico_errc::bad_version:
        fmt::format_to(out, " This library implements version {} of the Pico "
                            "encoding, but the file specifies that it uses "
                            "version {}.",
                       supported_version, status.file_version());
        break;

    case pico_errc::bad_offset:
        if (status.limit != 0U)
        {
            fmt::format_to(out, " The header extends to at least offset "
                                "0x{:X}, but the file specifies the data "
                                "offset as 0x{:X}.",
                           status.limit, status.observed);
        }
        else
        {
            fmt::format_to(out, " The data offset exceeds 32 bits.");
        }
        break;

    default:
        break;
    }

    if (status.site != io_site::none)
    {
        fmt::format_to(out, " [site {}]", static_cast<unsigned>(status.site));
    }
    if (status.cause != system_error::errc::success)
    {
        fmt::format_to(out, " caused by: {}", cause_message(status.cause));
    }
    return description;
}

} // namespace pico
