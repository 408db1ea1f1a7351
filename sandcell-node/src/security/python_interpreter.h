// python_interpreter.h - Process-wide embedded CPython used for AST analysis
#pragma once

#include <pybind11/embed.h>

namespace sandcell::node::security {

// Construct once near the top of main(). The GIL is released after start-up
// so any thread may analyse code with py::gil_scoped_acquire.
class PythonInterpreter {
public:
    PythonInterpreter();
    ~PythonInterpreter();

    PythonInterpreter(const PythonInterpreter&) = delete;
    PythonInterpreter& operator=(const PythonInterpreter&) = delete;

    bool IsInitialized() const { return initialized_; }

    static bool IsAvailable();

private:
    void ReleaseGIL();
    void AcquireGIL();

    bool initialized_ = false;
    bool initialized_by_us_ = false;
    PyThreadState* main_thread_state_ = nullptr;  // Saved when releasing GIL
};

} // namespace sandcell::node::security
