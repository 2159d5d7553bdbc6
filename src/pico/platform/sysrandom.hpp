#pragma once

#include <pico/disappointment.hpp>
#include <pico/span.hpp>

namespace pico::detail
{
auto random_bytes(rw_dynblob buffer) noexcept -> result<void>;
}
