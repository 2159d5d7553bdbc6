#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <pico/disappointment.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace pico::cli
{
/**
 * @brief CLI specific errors.
 */
enum class cli_errc : int
{
    /**
     * @brief Terminate the program with return value 1 now. Error message
     * should be printed before returning this error.
     */
    exit_error,
    /**
     * @brief The key must consist of an even number of hex digits.
     */
    bad_hex_key,
    /**
     * @brief Keys must have between 1 and 65535 bytes.
     */
    bad_key_size,
    /**
     * @brief The requested header format is unknown.
     */
    unknown_header_format,
    /**
     * @brief At least one file of a batch couldn't be processed.
     */
    batch_failed,
};

class cli_domain_type;
using cli_code = system_error::status_code<cli_domain_type>;
using cli_error = system_error::status_error<cli_domain_type>;

class cli_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "0E7A4C52-1B6D-4C8E-9F0B-6A2D91C0E3F7";

    constexpr ~cli_domain_type() noexcept = default;
    constexpr cli_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr cli_domain_type(cli_domain_type const &) noexcept = default;
    constexpr auto operator=(cli_domain_type const &) noexcept
            -> cli_domain_type & = default;

    using value_type = cli_errc;
    using base::string_ref;

    constexpr virtual auto name() const noexcept -> string_ref override
    {
        return string_ref("pico-cli-domain");
    }
    constexpr virtual auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(cli_domain_type *),
                std::max(alignof(value_type), alignof(cli_domain_type *))};
    }

    static constexpr auto get() noexcept -> cli_domain_type const &;

protected:
    constexpr virtual auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        (void)code;
        return true;
    }

    constexpr auto map_to_generic(value_type const value) const noexcept
            -> system_error::errc
    {
        using enum cli_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case bad_hex_key:
        case bad_key_size:
        case unknown_header_format:
            return sys_errc::invalid_argument;
        case exit_error:
        case batch_failed:
        default:
            return sys_errc::unknown;
        }
    }

    constexpr auto map_to_message(value_type const value) const noexcept
            -> std::string_view
    {
        using enum cli_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case exit_error:
            return "Terminate the program with return value 1 now."sv;
        case bad_hex_key:
            return "Keys must be specified as a list of hexadecimal digits (no spaces)."sv;
        case bad_key_size:
            return "Keys must consist of 1 to 65535 bytes."sv;
        case unknown_header_format:
            return "Unknown header format, valid formats are dict, json, yaml and xml."sv;
        case batch_failed:
            return "At least one file could not be processed."sv;

        default:
            return "unknown pico cli error code"sv;
        }
    }

    constexpr virtual auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &alhs = static_cast<cli_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return alhs.value() == static_cast<cli_code const &>(rhs).value();
        }
        else if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                && map_to_generic(alhs.value()) == sysErrc;
        }
        return false;
    }
    constexpr virtual auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<cli_code const &>(code).value());
    }

    constexpr virtual auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const cliCode = static_cast<cli_code const &>(code);
        auto const message = map_to_message(cliCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN virtual void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<cli_domain_type>(
                static_cast<cli_code const &>(code).clone());
    }
};
inline constexpr cli_domain_type cli_domain{};

constexpr auto cli_domain_type::get() noexcept -> cli_domain_type const &
{
    return cli_domain;
}

constexpr auto make_status_code(cli_errc c) noexcept -> cli_code
{
    return cli_code{system_error::in_place, c};
}

/**
 * @brief The type erased result type of the commandlets.
 */
template <typename R>
using cli_result = pico::result<R, system_error::error>;

} // namespace pico::cli

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
