#include "test-utils.hpp"

#include <filesystem>

namespace pico_tests
{

pico::llfio::path_handle const current_path = []
{
    auto currentPath = std::filesystem::current_path();
    return pico::llfio::path(currentPath).value();
}();

} // namespace pico_tests
