#include <grommet/util/string_utils.h>

namespace grommet {
    std::string to_string(nb::handle value) {
        try {
            return nb::cast<std::string>(nb::str(value));
        } catch (const nb::python_error &) { return nb::cast<std::string>(nb::repr(value)); }
    }

    std::string describe_host_exception(nb::handle exception) {
        auto type_name = nb::cast<std::string>(nb::handle(reinterpret_cast<PyObject *>(Py_TYPE(exception.ptr()))).attr("__name__"));
        auto message = to_string(exception);
        return message.empty() ? type_name : fmt::format("{}: {}", type_name, message);
    }

    std::string describe_host_exception(const nb::python_error &error) {
        return describe_host_exception(error.value());
    }
} // namespace grommet
