#pragma once

#include <exception>
#include <string>

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

namespace pico
{
enum class errinfo_param_name_tag
{
};
using errinfo_param_name
        = boost::error_info<errinfo_param_name_tag, const char *>;

enum class errinfo_param_misuse_description_tag
{
};
using errinfo_param_misuse_description
        = boost::error_info<errinfo_param_misuse_description_tag, std::string>;

class exception
    : public virtual std::exception
    , public virtual boost::exception
{
};

class logic_error : public virtual exception
{
};

class invalid_argument : public virtual logic_error
{
};

} // namespace pico
