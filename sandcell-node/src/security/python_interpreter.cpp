// python_interpreter.cpp - Embedded interpreter lifetime
#include "security/python_interpreter.h"
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace sandcell::node::security {

PythonInterpreter::PythonInterpreter() {
    if (Py_IsInitialized()) {
        spdlog::info("PythonInterpreter: Reusing already initialized interpreter");
        initialized_ = true;
        return;
    }

    py::initialize_interpreter();
    initialized_ = true;
    initialized_by_us_ = true;
    spdlog::info("PythonInterpreter: Initialized (Python {})", Py_GetVersion());

    ReleaseGIL();
}

PythonInterpreter::~PythonInterpreter() {
    if (initialized_ && initialized_by_us_) {
        AcquireGIL();
        py::finalize_interpreter();
        spdlog::debug("PythonInterpreter: Finalized");
    }
    initialized_ = false;
}

bool PythonInterpreter::IsAvailable() {
    return Py_IsInitialized() != 0;
}

void PythonInterpreter::ReleaseGIL() {
    if (main_thread_state_ == nullptr) {
        main_thread_state_ = PyEval_SaveThread();
    }
}

void PythonInterpreter::AcquireGIL() {
    if (main_thread_state_ != nullptr) {
        PyEval_RestoreThread(main_thread_state_);
        main_thread_state_ = nullptr;
    }
}

} // namespace sandcell::node::security
