#include <pico/crypt.hpp>

#include <pico/exceptions.hpp>

namespace pico
{

void crypt(std::uint64_t position, rw_dynblob buffer, ro_dynblob key)
{
    if (key.empty())
    {
        BOOST_THROW_EXCEPTION(
                invalid_argument{}
                << errinfo_param_name{"key"}
                << errinfo_param_misuse_description{
                           "the key stream of an empty key is undefined"});
    }

    auto const keySize = key.size();
    auto keyIndex = static_cast<std::size_t>(position % keySize);
    for (auto &b : buffer)
    {
        b ^= key[keyIndex];
        if (++keyIndex == keySize)
        {
            keyIndex = 0;
        }
    }
}

} // namespace pico
