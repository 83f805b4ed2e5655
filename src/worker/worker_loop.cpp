#include "worker/worker_loop.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/wire_protocol.hpp"

namespace snipvisor::worker {

using protocol::ExecutionFailure;
using protocol::ExecutionResult;
using protocol::WireRequest;

WorkerLoop::WorkerLoop(Interpreter& interpreter, std::istream& in, std::ostream& out)
    : interpreter_(interpreter), in_(in), out_(out) {}

int WorkerLoop::run() {
    out_ << protocol::kReadySentinel << std::endl;
    if (!out_.good()) {
        SNIPVISOR_LOG_ERROR("Worker: failed to write READY sentinel");
        return 1;
    }

    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) {
            continue;
        }
        out_ << handle_line(line) << std::endl;
        if (!out_.good()) {
            SNIPVISOR_LOG_ERROR("Worker: response channel closed");
            return 1;
        }
    }

    SNIPVISOR_LOG_DEBUG("Worker: stdin closed after " +
                        std::to_string(handled_count_) + " requests");
    return 0;
}

std::string WorkerLoop::handle_line(const std::string& line) {
    ++handled_count_;

    auto decoded = protocol::decode_request(line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        SNIPVISOR_LOG_WARN("Worker: rejecting request [" + err.code + "]: " + err.message);
        return protocol::encode_response(
            ExecutionFailure{err.message, "InvalidRequest: " + err.message, "", ""});
    }
    WireRequest request = core::errors::get_value(decoded);

    if (request.code.empty() && request.input.has_value()) {
        auto extracted = protocol::extract_code_block(request.input.value());
        if (extracted.has_value()) {
            request.code = std::move(extracted.value());
        }
    }
    if (request.code.empty()) {
        return protocol::encode_response(ExecutionFailure{"No code provided", "", "", ""});
    }

    const AncillarySnapshot snapshot = interpreter_.snapshot(request.reset_modules);
    const ExecutionResult result =
        interpreter_.evaluate(request.code, request.input.value_or(""));
    const RestoreReport report = interpreter_.restore(snapshot, request.reset_search_path);

    if (report.search_path_entries_removed > 0 || report.modules_unloaded > 0) {
        SNIPVISOR_LOG_DEBUG("Worker: restored search path (-" +
                            std::to_string(report.search_path_entries_removed) +
                            ") and unloaded " + std::to_string(report.modules_unloaded) +
                            " modules (" + std::to_string(report.modules_skipped) +
                            " skipped)");
    }

    if (request.collect_garbage) {
        interpreter_.collect_garbage();
    }

    return protocol::encode_response(result);
}

}  // namespace snipvisor::worker
