#pragma once

#include <cstdint>

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <status-code/error.hpp>
#include <status-code/system_code.hpp>

#include <pico/format.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace pico
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

enum class pico_errc : std::uint8_t
{
    success = 0,
    store_not_found,
    store_already_exists,
    seek_failed,
    read_failed,
    write_failed,
    not_pico,
    bad_version,
    key_error,
    bad_offset,
    hash_error,
    internal_error,
};

/**
 * Identifies the store access which failed. The numbers are stable and
 * are printed with the diagnostic output of the cli.
 */
enum class io_site : std::uint16_t
{
    none = 0,
    create_sync = 1001,
    header_prefix_read = 1002,
    header_key_read = 1008,
    flush_sync = 1009,
    metadata_read_seek = 1010,
    metadata_read = 1011,
    metadata_write_seek = 1012,
    metadata_write = 1013,
    data_read_seek = 1014,
    data_read = 1015,
    data_write_seek = 1016,
    data_write = 1017,
    header_write = 1019,
    store_open = 1026,
    store_create = 1027,
    random_source = 1029,
    plain_read = 1030,
    plain_write = 1031,
    plain_sync = 1032,
};

/**
 * The payload of a pico status code.
 *
 * Which of the value fields are meaningful depends on the kind:
 * - not_pico: observed is the magic number read from the store
 * - bad_version: observed is the packed version of the store
 * - bad_offset: observed is the stored data offset, limit the minimum
 * - I/O kinds: site and cause
 */
struct pico_status
{
    pico_errc kind{pico_errc::success};
    io_site site{io_site::none};
    system_error::errc cause{system_error::errc::success};
    std::uint32_t observed{0};
    std::uint32_t limit{0};

    constexpr auto file_version() const noexcept -> format_version
    {
        return unpack_version(observed);
    }
};

class pico_domain_type;
using pico_code = system_error::status_code<pico_domain_type>;

class pico_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "6C0B8F41-93D8-4E1A-A3A5-2F6E0D4B91C0";

    constexpr ~pico_domain_type() noexcept = default;
    constexpr pico_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr pico_domain_type(pico_domain_type const &) noexcept = default;
    constexpr auto operator=(pico_domain_type const &) noexcept
            -> pico_domain_type & = default;

    using value_type = pico_status;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("pico-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(pico_domain_type *),
                std::max(alignof(value_type), alignof(pico_domain_type *))};
    }

    static constexpr auto get() noexcept -> pico_domain_type const &;

    [[nodiscard]] static constexpr auto
    map_to_generic(pico_errc const value) noexcept -> system_error::errc
    {
        using enum pico_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case store_not_found:
            return sys_errc::no_such_file_or_directory;

        case store_already_exists:
            return sys_errc::file_exists;

        case seek_failed:
        case read_failed:
        case write_failed:
            return sys_errc::io_error;

        case not_pico:
        case bad_version:
        case bad_offset:
            return sys_errc::bad_message;

        case key_error:
            return sys_errc::invalid_argument;

        case hash_error:
        case internal_error:
        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] static constexpr auto
    map_to_message(pico_errc const value) noexcept -> std::string_view
    {
        using enum pico_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case success:
            return "success"sv;

        case store_not_found:
            return "File was not found."sv;

        case store_already_exists:
            return "File already exists."sv;

        case seek_failed:
            return "Seeking within a file failed."sv;

        case read_failed:
            return "Reading from a file failed."sv;

        case write_failed:
            return "Writing to a file failed."sv;

        case not_pico:
            return "The file does not appear to be a Pico-encoded file."sv;

        case bad_version:
            return "This version of the library cannot read the version of the Pico encoding used in the file."sv;

        case key_error:
            return "A key must consist of 1 to 65535 bytes."sv;

        case bad_offset:
            return "The data offset in the file is incorrect."sv;

        case hash_error:
            return "An error occurred computing the hash."sv;

        case internal_error:
            return "An internal error was detected in the pico library."sv;

        default:
            return "unknown pico error code"sv;
        }
    }

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<pico_code const &>(code).value().kind
               != pico_errc::success;
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &plhs = static_cast<pico_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return plhs.value().kind
                   == static_cast<pico_code const &>(rhs).value().kind;
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(plhs.value().kind) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<pico_code const &>(code).value().kind);
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const &picoCode = static_cast<pico_code const &>(code);
        auto const message = map_to_message(picoCode.value().kind);
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<pico_domain_type>(
                static_cast<pico_code const &>(code).clone());
    }
};
inline constexpr pico_domain_type pico_domain{};

constexpr auto pico_domain_type::get() noexcept -> pico_domain_type const &
{
    return pico_domain;
}

constexpr auto make_status_code(pico_errc c) noexcept -> pico_code
{
    return pico_code(system_error::in_place, pico_status{.kind = c});
}

} // namespace pico

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
