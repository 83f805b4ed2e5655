#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <unistd.h>
#include "core/errors/supervisor_errors.hpp"
#include "core/logging/logger.hpp"
#include "worker/fd_output_buf.hpp"
#include "worker/python_interpreter.hpp"
#include "worker/worker_loop.hpp"

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--verbose") {
            snipvisor::core::logging::Logger::get().set_min_level(
                snipvisor::core::logging::LogLevel::DEBUG);
        }
    }
    snipvisor::core::logging::Logger::get().set_instance_tag(
        "worker " + std::to_string(getpid()));

    // Keep the protocol channel on a private descriptor and point fd 1 at
    // stderr, so stray writes from snippets cannot desynchronize the stream.
    const int protocol_fd = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
    if (protocol_fd < 0) {
        SNIPVISOR_LOG_ERROR(std::string("Worker: cannot duplicate stdout: ") +
                            std::strerror(errno));
        return 1;
    }
    if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        SNIPVISOR_LOG_ERROR(std::string("Worker: cannot redirect stdout: ") +
                            std::strerror(errno));
        return 1;
    }

    auto created = snipvisor::worker::PythonInterpreter::create();
    if (snipvisor::core::errors::is_error(created)) {
        const auto& err = snipvisor::core::errors::get_error(created);
        SNIPVISOR_LOG_ERROR("Worker: startup failed [" + err.code + "]: " + err.message);
        return 3;
    }
    auto interpreter =
        std::move(std::get<std::unique_ptr<snipvisor::worker::PythonInterpreter>>(created));

    snipvisor::worker::FdOutputBuf protocol_buf(protocol_fd);
    std::ostream protocol_out(&protocol_buf);
    snipvisor::worker::WorkerLoop loop(*interpreter, std::cin, protocol_out);
    const int status = loop.run();

    protocol_out.flush();
    static_cast<void>(close(protocol_fd));
    return status;
}
