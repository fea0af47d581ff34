#ifndef GROMMET_UTIL_STRING_UTILS_H
#define GROMMET_UTIL_STRING_UTILS_H

#include <grommet/grommet_base.h>

#include <string>

namespace grommet {
    // str(value), falling back to repr(value) when __str__ raises. Requires the interpreter lock.
    std::string to_string(nb::handle value);

    // "<ExceptionType>: <str(exc)>", the text a host failure carries into a response. Requires the interpreter lock.
    std::string describe_host_exception(const nb::python_error &error);

    // Same as above for an exception instance delivered by a completed host future.
    std::string describe_host_exception(nb::handle exception);
} // namespace grommet

#endif // GROMMET_UTIL_STRING_UTILS_H
