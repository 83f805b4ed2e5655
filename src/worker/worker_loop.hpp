#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "worker/interpreter.hpp"

namespace snipvisor::worker {

class WorkerLoop {
public:
    WorkerLoop(Interpreter& interpreter, std::istream& in, std::ostream& out);

    // Prints the READY sentinel, then answers one line per request line until
    // EOF. Returns the process exit status.
    int run();

    // Evaluates one request line and returns the response line (no newline).
    std::string handle_line(const std::string& line);

    std::uint64_t handled_count() const { return handled_count_; }

private:
    Interpreter& interpreter_;
    std::istream& in_;
    std::ostream& out_;
    std::uint64_t handled_count_ = 0;
};

}  // namespace snipvisor::worker
