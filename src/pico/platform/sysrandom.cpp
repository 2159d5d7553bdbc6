#include "sysrandom.hpp"

#include <algorithm>
#include <type_traits>

#include <boost/predef.h>

#include <status-code/posix_code.hpp>

namespace
{
auto random_source_error(pico::system_error::errc cause) noexcept
        -> pico::pico_code
{
    return pico::make_io_error(pico::pico_errc::internal_error,
                               pico::io_site::random_source, cause);
}
auto random_source_error() noexcept -> pico::pico_code
{
    return pico::make_io_error(pico::pico_errc::internal_error,
                               pico::io_site::random_source,
                               pico::system_error::posix_code::current());
}
} // namespace

#if defined(BOOST_OS_LINUX_AVAILABLE)

#include <sys/random.h>
#include <sys/types.h>

auto pico::detail::random_bytes(rw_dynblob buffer) noexcept
        -> pico::result<void>
{
    if (buffer.empty())
    {
        return random_source_error(system_error::errc::invalid_argument);
    }

    constexpr std::size_t maxChunkSize{33'554'431};

    while (!buffer.empty())
    {
        auto const chunkSize = std::min(maxChunkSize, buffer.size());

        ssize_t const readResult
                = ::getrandom(static_cast<void *>(buffer.data()), chunkSize, 0);
        if (readResult == -1)
        {
            return random_source_error();
        }
        if (readResult == 0)
        {
            return random_source_error(system_error::errc::io_error);
        }
        buffer = buffer.subspan(static_cast<size_t>(readResult));
    }
    return outcome::success();
}

#elif defined(BOOST_OS_UNIX_AVAILABLE) || defined(BOOST_OS_MACOS_AVAILABLE)

#include <unistd.h>

auto pico::detail::random_bytes(rw_dynblob buffer) noexcept
        -> pico::result<void>
{
    if (buffer.empty())
    {
        return random_source_error(system_error::errc::invalid_argument);
    }

    constexpr std::size_t maxChunkSize{256};

    while (!buffer.empty())
    {
        auto const chunkSize = std::min(maxChunkSize, buffer.size());

        if (::getentropy(static_cast<void *>(buffer.data()), chunkSize) != 0)
        {
            return random_source_error();
        }
        buffer = buffer.subspan(chunkSize);
    }
    return outcome::success();
}

#else
#error "random_bytes() is not implemented on your operating system"
#endif
