#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace fxfer::core {

struct ProgressEvent {
    std::uint32_t percent = 0;      // 0..100
    std::string file_name;          // базовое имя последнего скопированного файла
};

struct DoneEvent {};

struct CancelledEvent {};

struct ErrorEvent {
    std::string message;
};

using TransferEvent = std::variant<ProgressEvent, DoneEvent, CancelledEvent, ErrorEvent>;

// Done, Cancelled и Error завершают передачу: после них событий нет
[[nodiscard]] auto is_terminal(const TransferEvent& event) -> bool;

[[nodiscard]] auto describe(const TransferEvent& event) -> std::string;

} // namespace fxfer::core
