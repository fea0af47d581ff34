#include <grommet/python/host_value.h>

namespace grommet {
    HostValue::~HostValue() {
        if (_ptr == nullptr || !Py_IsInitialized()) { return; }
        nb::gil_scoped_acquire gil;
        Py_DECREF(_ptr);
    }
} // namespace grommet
