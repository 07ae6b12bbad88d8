#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "../channel/transfer_event.hpp"
#include "../coordinator/transfer_coordinator.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fxfer::core {

using TransferHandle = std::uint64_t;

/// Граница движка для слоя представления.
///
/// Каждая передача выполняется в собственном фоновом потоке со своим каналом
/// событий и своим флагом отмены, так что независимые передачи не мешают друг
/// другу. Политику "одна передача за раз" задаёт потребитель.
class TransferEngine {
public:
    explicit TransferEngine(infra::Config config = {});
    // Отменяет всё незавершённое и дожидается фоновых потоков
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Синхронно отказывает только при пустом source или destination
    [[nodiscard]] auto start_transfer(const std::filesystem::path& source,
                                      const std::filesystem::path& destination)
        -> infra::Result<TransferHandle>;

    // Идемпотентно; для неизвестной или завершённой передачи ничего не делает
    void cancel(TransferHandle handle);

    // Неблокирующая выборка всех событий с прошлого опроса
    [[nodiscard]] auto poll_events(TransferHandle handle) -> std::vector<TransferEvent>;

    [[nodiscard]] auto is_active(TransferHandle handle) const -> bool;

    // Блокирует до завершения передачи; nullopt для неизвестного handle
    auto wait(TransferHandle handle) -> std::optional<TransferSummary>;

    // Забывает передачу; активная передача сначала дорабатывает
    void release(TransferHandle handle);

private:
    struct Session;

    [[nodiscard]] auto find(TransferHandle handle) const -> std::shared_ptr<Session>;

    const infra::Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<TransferHandle, std::shared_ptr<Session>> sessions_;
    TransferHandle next_handle_ = 1;
};

} // namespace fxfer::core
