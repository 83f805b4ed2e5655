#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "worker/python_interpreter.hpp"

#include <cctype>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace snipvisor::worker {

using core::errors::ErrorCategory;
using core::errors::SupervisorError;
using protocol::ExecutionFailure;
using protocol::ExecutionResult;
using protocol::ExecutionSuccess;

namespace {

// Owning reference to a PyObject.
class PyRef {
public:
    PyRef() = default;
    explicit PyRef(PyObject* object) : object_(object) {}
    ~PyRef() { Py_XDECREF(object_); }

    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;

    PyRef(PyRef&& other) noexcept : object_(other.release()) {}
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    void reset(PyObject* object = nullptr) {
        Py_XDECREF(object_);
        object_ = object;
    }

    PyObject* release() {
        PyObject* object = object_;
        object_ = nullptr;
        return object;
    }

    PyObject* get() const { return object_; }
    explicit operator bool() const { return object_ != nullptr; }

private:
    PyObject* object_ = nullptr;
};

// Swaps sys.<name> for the lifetime of the scope.
class StreamRedirect {
public:
    StreamRedirect(const char* name, PyObject* replacement) : name_(name) {
        PyObject* current = PySys_GetObject(name);
        Py_XINCREF(current);
        saved_.reset(current);
        if (PySys_SetObject(name, replacement) != 0) {
            PyErr_Clear();
        }
    }

    ~StreamRedirect() {
        if (PySys_SetObject(name_, saved_.get()) != 0) {
            PyErr_Clear();
        }
    }

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

private:
    const char* name_;
    PyRef saved_;
};

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_utf8(PyObject* text) {
    PyRef bytes(PyUnicode_AsEncodedString(text, "utf-8", "replace"));
    if (!bytes) {
        PyErr_Clear();
        return "";
    }
    return std::string(PyBytes_AS_STRING(bytes.get()),
                       static_cast<std::size_t>(PyBytes_GET_SIZE(bytes.get())));
}

std::string str_of(PyObject* object) {
    PyRef text(PyObject_Str(object));
    if (!text) {
        PyErr_Clear();
        return std::string("<unprintable ") + Py_TYPE(object)->tp_name + ">";
    }
    return to_utf8(text.get());
}

std::string buffer_contents(PyObject* buffer) {
    PyRef value(PyObject_CallMethod(buffer, "getvalue", nullptr));
    if (!value) {
        PyErr_Clear();
        return "";
    }
    return trim(to_utf8(value.get()));
}

std::string current_error_text() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);
    if (value != nullptr) {
        return str_of(value);
    }
    return type != nullptr ? str_of(type) : "unknown error";
}

}  // namespace

struct PythonInterpreter::Impl {
    bool owns_runtime = false;
    PyRef io_module;
    PyRef traceback_module;

    std::string format_trace(PyObject* type, PyObject* value, PyObject* traceback) const {
        PyRef lines(PyObject_CallMethod(traceback_module.get(), "format_exception", "OOO",
                                        type, value != nullptr ? value : Py_None,
                                        traceback != nullptr ? traceback : Py_None));
        if (!lines) {
            PyErr_Clear();
            return "";
        }
        PyRef separator(PyUnicode_FromString(""));
        PyRef joined(PyUnicode_Join(separator.get(), lines.get()));
        if (!joined) {
            PyErr_Clear();
            return "";
        }
        return to_utf8(joined.get());
    }

    PyRef make_string_io(const std::string& initial) const {
        PyRef text(PyUnicode_DecodeUTF8(initial.data(),
                                        static_cast<Py_ssize_t>(initial.size()), "replace"));
        if (!text) {
            return PyRef();
        }
        return PyRef(PyObject_CallMethod(io_module.get(), "StringIO", "O", text.get()));
    }
};

PythonInterpreter::PythonInterpreter() : impl_(std::make_unique<Impl>()) {}

core::errors::Result<std::unique_ptr<PythonInterpreter>> PythonInterpreter::create() {
    std::unique_ptr<PythonInterpreter> interpreter(new PythonInterpreter());
    if (!Py_IsInitialized()) {
        // No signal handlers: the supervisor owns the worker's lifecycle.
        Py_InitializeEx(0);
        interpreter->impl_->owns_runtime = true;
    }
    if (!Py_IsInitialized()) {
        return SupervisorError{ErrorCategory::Startup,
                               "Failed to initialize the Python runtime.",
                               "python_init_failed"};
    }

    // Held for the whole session so that module resets never unload them.
    interpreter->impl_->io_module.reset(PyImport_ImportModule("io"));
    interpreter->impl_->traceback_module.reset(PyImport_ImportModule("traceback"));
    if (!interpreter->impl_->io_module || !interpreter->impl_->traceback_module) {
        const std::string reason = current_error_text();
        return SupervisorError{ErrorCategory::Startup,
                               "Failed to import Python support modules: " + reason,
                               "python_init_failed"};
    }

    SNIPVISOR_LOG_DEBUG(std::string("Worker: embedded Python ") + Py_GetVersion());
    return std::move(interpreter);
}

PythonInterpreter::~PythonInterpreter() {
    if (!impl_) {
        return;
    }
    impl_->io_module.reset();
    impl_->traceback_module.reset();
    if (impl_->owns_runtime && Py_IsInitialized()) {
        if (Py_FinalizeEx() != 0) {
            SNIPVISOR_LOG_WARN("Worker: Python runtime did not finalize cleanly");
        }
    }
}

AncillarySnapshot PythonInterpreter::snapshot(const bool include_modules) {
    AncillarySnapshot snapshot;
    PyObject* path = PySys_GetObject("path");
    if (path != nullptr && PyList_Check(path)) {
        snapshot.search_path_length = static_cast<std::size_t>(PyList_Size(path));
    }

    if (include_modules) {
        std::set<std::string> names;
        PyObject* modules = PyImport_GetModuleDict();
        PyObject* key = nullptr;
        PyObject* value = nullptr;
        Py_ssize_t pos = 0;
        while (PyDict_Next(modules, &pos, &key, &value)) {
            if (PyUnicode_Check(key)) {
                names.insert(to_utf8(key));
            }
        }
        snapshot.loaded_modules = std::move(names);
    }
    return snapshot;
}

ExecutionResult PythonInterpreter::evaluate(const std::string& code,
                                            const std::string& input) {
    PyRef stdout_buffer = impl_->make_string_io("");
    PyRef stderr_buffer = impl_->make_string_io("");
    PyRef stdin_buffer = impl_->make_string_io(input);
    PyRef globals(PyDict_New());
    PyRef locals(PyDict_New());
    if (!stdout_buffer || !stderr_buffer || !stdin_buffer || !globals || !locals) {
        return ExecutionFailure{"Interpreter setup failed: " + current_error_text(), "", "",
                                ""};
    }
    if (PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) != 0) {
        return ExecutionFailure{"Interpreter setup failed: " + current_error_text(), "", "",
                                ""};
    }

    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    {
        StreamRedirect redirect_stdout("stdout", stdout_buffer.get());
        StreamRedirect redirect_stderr("stderr", stderr_buffer.get());
        StreamRedirect redirect_stdin("stdin", stdin_buffer.get());

        PyRef result(PyRun_String(code.c_str(), Py_file_input, globals.get(), locals.get()));
        if (!result) {
            PyErr_Fetch(&type, &value, &traceback);
            PyErr_NormalizeException(&type, &value, &traceback);
            if (value != nullptr && traceback != nullptr) {
                PyException_SetTraceback(value, traceback);
            }
        }
    }
    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    const std::string captured_stdout = buffer_contents(stdout_buffer.get());
    const std::string captured_stderr = buffer_contents(stderr_buffer.get());

    if (type != nullptr) {
        ExecutionFailure failure;
        failure.message = value != nullptr ? str_of(value) : str_of(type);
        failure.trace = impl_->format_trace(type, value, traceback);
        failure.stdout_text = captured_stdout;
        failure.stderr_text = captured_stderr;
        return failure;
    }

    ExecutionSuccess success;
    success.stdout_text = captured_stdout;
    success.stderr_text = captured_stderr;
    PyObject* key = nullptr;
    PyObject* binding = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(locals.get(), &pos, &key, &binding)) {
        const std::string name = PyUnicode_Check(key) ? to_utf8(key) : str_of(key);
        success.bindings[name] = str_of(binding);
    }
    return success;
}

RestoreReport PythonInterpreter::restore(const AncillarySnapshot& snapshot,
                                         const bool reset_search_path) {
    RestoreReport report;

    if (reset_search_path) {
        PyObject* path = PySys_GetObject("path");
        if (path != nullptr && PyList_Check(path)) {
            const Py_ssize_t current = PyList_Size(path);
            const auto saved = static_cast<Py_ssize_t>(snapshot.search_path_length);
            if (current > saved) {
                if (PyList_SetSlice(path, saved, current, nullptr) == 0) {
                    report.search_path_entries_removed =
                        static_cast<std::size_t>(current - saved);
                } else {
                    PyErr_Clear();
                }
            }
        }
    }

    if (snapshot.loaded_modules.has_value()) {
        const auto& before = snapshot.loaded_modules.value();
        PyObject* modules = PyImport_GetModuleDict();
        std::vector<std::string> added;
        PyObject* key = nullptr;
        PyObject* value = nullptr;
        Py_ssize_t pos = 0;
        while (PyDict_Next(modules, &pos, &key, &value)) {
            if (!PyUnicode_Check(key)) {
                continue;
            }
            std::string name = to_utf8(key);
            if (before.find(name) == before.end()) {
                added.push_back(std::move(name));
            }
        }

        for (const auto& name : added) {
            // Private and runtime-intrinsic modules stay loaded.
            if (!name.empty() && name.front() == '_') {
                ++report.modules_skipped;
                continue;
            }
            if (PyDict_DelItemString(modules, name.c_str()) == 0) {
                ++report.modules_unloaded;
            } else {
                PyErr_Clear();
                ++report.modules_skipped;
            }
        }
    }

    return report;
}

void PythonInterpreter::collect_garbage() {
    const Py_ssize_t collected = PyGC_Collect();
    SNIPVISOR_LOG_DEBUG("Worker: gc collected " + std::to_string(collected) + " objects");
}

}  // namespace snipvisor::worker
