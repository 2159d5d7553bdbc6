#pragma once

#include <cstdint>

#include <concepts>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <boost/predef.h>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(push, 3)
#pragma warning(disable : 6285)
#endif

#include <outcome/bad_access.hpp>
#include <outcome/experimental/status_result.hpp>
#include <outcome/try.hpp>
#include <status-code/error.hpp>
#include <status-code/generic_code.hpp>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(pop)
#endif

#include <pico/disappointment/errc.hpp>

namespace pico
{
namespace outcome = OUTCOME_V2_NAMESPACE;
namespace oc = OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                // moving lvalues is expected in this case.
                // NOLINTNEXTLINE(bugprone-move-forwarding-reference)
                base::_error(std::move(self)).throw_exception();
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

} // namespace detail

using oc::failure;
using oc::success;

/**
 * The library reports failures with the rich pico_code which carries the
 * diagnostic payload. Type erased system_error::error results are used by
 * the cli only.
 */
template <typename R, typename E = pico_code>
using result = oc::basic_result<R, E, detail::result_no_value_policy>;

/**
 * Creates a failure code of the given kind without I/O details.
 */
constexpr auto make_error(pico_errc kind,
                          io_site site = io_site::none) noexcept -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = kind, .site = site});
}

constexpr auto make_not_pico_error(std::uint16_t observedMagic) noexcept
        -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = pico_errc::not_pico,
                                 .observed = observedMagic});
}

constexpr auto make_bad_version_error(format_version fileVersion) noexcept
        -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = pico_errc::bad_version,
                                 .observed = pack(fileVersion)});
}

constexpr auto make_bad_offset_error(std::uint32_t storedOffset,
                                     std::uint32_t minimumOffset) noexcept
        -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = pico_errc::bad_offset,
                                 .observed = storedOffset,
                                 .limit = minimumOffset});
}

/**
 * Reduces an arbitrary status code (usually an llfio file_io_error) to the
 * generic error condition it is equivalent to.
 */
auto generic_cause_of(system_error::status_code<void> const &code) noexcept
        -> system_error::errc;

/**
 * Wraps a failed store access into a pico_code.
 */
inline auto make_io_error(pico_errc kind,
                          io_site site,
                          system_error::status_code<void> const &cause) noexcept
        -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = kind,
                                 .site = site,
                                 .cause = generic_cause_of(cause)});
}
inline auto make_io_error(pico_errc kind,
                          io_site site,
                          system_error::errc cause) noexcept -> pico_code
{
    return pico_code(system_error::in_place,
                     pico_status{.kind = kind, .site = site, .cause = cause});
}

/**
 * Renders the message of the kind followed by the payload details,
 * e.g. the observed magic number or the offending offsets.
 */
auto describe(pico_code const &code) -> std::string;

template <typename T, typename... Args>
    requires(!std::is_array_v<T>)
auto make_unique_nothrow(Args &&...args) noexcept(
        std::is_nothrow_constructible_v<T, Args...>) -> std::unique_ptr<T>
{
    return std::unique_ptr<T>(new (std::nothrow)
                                      T(std::forward<Args>(args)...));
}

} // namespace pico

template <>
struct fmt::formatter<pico::pico_code>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(pico::pico_code const &code, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", pico::describe(code));
    }
};

template <>
struct fmt::formatter<pico::format_version>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(pico::format_version const &v, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}.{}", v.major_number,
                              v.minor_number);
    }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define PICO_TRY OUTCOME_TRY

// NOLINTEND(cppcoreguidelines-macro-usage)
