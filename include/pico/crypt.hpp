#pragma once

#include <cstdint>

#include <pico/span.hpp>

namespace pico
{

/**
 * Applies the position keyed xor stream to the buffer in place.
 *
 * Byte i of the buffer is combined with key[(position + i) % key.size()],
 * therefore applying the transform twice with the same arguments yields the
 * original content. position is relative to the start of the data region.
 *
 * @throws invalid_argument if the key is empty
 */
void crypt(std::uint64_t position, rw_dynblob buffer, ro_dynblob key);

} // namespace pico
