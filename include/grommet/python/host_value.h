//
// Reference to a python object that may travel through the worker pool.
//

#ifndef GROMMET_PYTHON_HOST_VALUE_H
#define GROMMET_PYTHON_HOST_VALUE_H

#include <grommet/grommet_base.h>

#include <memory>

namespace grommet {
    /**
     * Proof that the calling thread holds the interpreter lock. Every function touching a python object takes
     * one, so code that forgot to acquire the lock does not compile rather than corrupting reference counts.
     */
    class GROMMET_EXPORT ExecutionToken {
    public:
        // Only for call sites entered from python, where nanobind already holds the lock.
        static ExecutionToken assume_held() noexcept { return ExecutionToken{}; }

    private:
        friend class ScopedExecution;

        ExecutionToken() = default;
    };

    // Acquires the interpreter lock for its lifetime and hands out the matching token.
    class GROMMET_EXPORT ScopedExecution {
    public:
        ScopedExecution() = default;

        ScopedExecution(const ScopedExecution &) = delete;

        ScopedExecution &operator=(const ScopedExecution &) = delete;

        [[nodiscard]] const ExecutionToken &token() const { return _token; }

    private:
        nb::gil_scoped_acquire _gil;
        ExecutionToken _token;
    };

    /**
     * Owned, immutable handle to a python object. Engine structures share it as host_value_ptr; the reference is
     * released under the interpreter lock by whichever thread drops the last copy. Releasing after the
     * interpreter has been finalized is a no-op.
     */
    class GROMMET_EXPORT HostValue {
    public:
        // Takes over the reference held by value.
        HostValue(const ExecutionToken &, nb::object value) : _ptr{value.release().ptr()} {}

        HostValue(HostValue &&other) noexcept : _ptr{other._ptr} { other._ptr = nullptr; }

        HostValue(const HostValue &) = delete;

        HostValue &operator=(const HostValue &) = delete;

        HostValue &operator=(HostValue &&) = delete;

        ~HostValue();

        static host_value_ptr make(const ExecutionToken &token, nb::handle value) {
            return std::make_shared<const HostValue>(token, nb::borrow(value));
        }

        // Borrowed view, valid while this handle lives.
        [[nodiscard]] nb::handle bind(const ExecutionToken &) const { return nb::handle(_ptr); }

        // New owned reference.
        [[nodiscard]] nb::object clone_ref(const ExecutionToken &) const { return nb::borrow(_ptr); }

    private:
        PyObject *_ptr;
    };

    // None when the handle is empty.
    inline nb::object bind_or_none(const ExecutionToken &token, const host_value_ptr &value) {
        return value ? value->clone_ref(token) : nb::none();
    }
} // namespace grommet

#endif // GROMMET_PYTHON_HOST_VALUE_H
