#pragma once

#include <memory>
#include <string>
#include "core/errors/supervisor_errors.hpp"
#include "worker/interpreter.hpp"

namespace snipvisor::worker {

// Interpreter backed by an embedded CPython runtime. Each snippet runs with an
// empty globals dict (plus builtins) and an empty locals dict; the locals are
// reported back as bindings. Not thread-safe: the owning thread holds the GIL
// for the lifetime of the object.
class PythonInterpreter : public Interpreter {
public:
    static core::errors::Result<std::unique_ptr<PythonInterpreter>> create();

    ~PythonInterpreter() override;

    PythonInterpreter(const PythonInterpreter&) = delete;
    PythonInterpreter& operator=(const PythonInterpreter&) = delete;

    AncillarySnapshot snapshot(bool include_modules) override;
    protocol::ExecutionResult evaluate(const std::string& code,
                                       const std::string& input) override;
    RestoreReport restore(const AncillarySnapshot& snapshot,
                          bool reset_search_path) override;
    void collect_garbage() override;

private:
    struct Impl;

    PythonInterpreter();

    std::unique_ptr<Impl> impl_;
};

}  // namespace snipvisor::worker
