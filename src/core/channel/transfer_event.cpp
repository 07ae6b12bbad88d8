#include "transfer_event.hpp"
#include <fmt/core.h>

namespace fxfer::core {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

bool is_terminal(const TransferEvent& event) {
    return !std::holds_alternative<ProgressEvent>(event);
}

std::string describe(const TransferEvent& event) {
    return std::visit(overloaded{
        [](const ProgressEvent& e) { return fmt::format("progress {}% ({})", e.percent, e.file_name); },
        [](const DoneEvent&) { return std::string("done"); },
        [](const CancelledEvent&) { return std::string("cancelled"); },
        [](const ErrorEvent& e) { return fmt::format("error: {}", e.message); },
    }, event);
}

} // namespace fxfer::core
