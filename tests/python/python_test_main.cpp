/**
 * Entry point for the tests that drive the _grommet module through an embedded interpreter.
 *
 * The module is linked into this executable and registered as a builtin before the interpreter starts, so the
 * tests import it exactly as python code would.
 */

#include <catch2/catch_session.hpp>

#include <Python.h>

extern "C" PyObject *PyInit__grommet();

int main(int argc, char *argv[]) {
    if (PyImport_AppendInittab("_grommet", &PyInit__grommet) == -1) { return 1; }
    Py_Initialize();
    int result = Catch::Session().run(argc, argv);
    Py_Finalize();
    return result;
}
