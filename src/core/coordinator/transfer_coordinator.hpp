#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>
#include "../types.hpp"
#include "../cancellation.hpp"
#include "../channel/event_channel.hpp"
#include "../worker/copy_worker.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fxfer::core {

enum class TransferPhase {
    Idle,
    Planning,
    Copying,
    Completed,
    Cancelled,
    Failed,
};

[[nodiscard]] auto to_string(TransferPhase phase) -> std::string_view;

struct TransferSummary {
    TransferPhase phase = TransferPhase::Idle;
    std::uint64_t files_planned = 0;
    std::uint64_t files_copied = 0;
    std::uint64_t files_unchanged = 0;
    std::uint64_t files_dropped = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t copied_bytes = 0;
    std::uint32_t pool_size = 0;          // 0: единственный файл скопирован без пула
    std::optional<infra::Error> error;    // первая ошибка, если phase == Failed
};

/// Ведёт одну передачу: Idle -> Planning -> Copying -> Completed | Cancelled | Failed.
///
/// run() блокирует вызывающий поток до тех пор, пока все запущенные задачи не
/// вернутся, и публикует в канал ровно одно терминальное событие последним.
/// После первой ошибки новые задачи не стартуют; уже идущие дорабатывают.
class TransferCoordinator {
public:
    TransferCoordinator(TransferRequest request,
                        const infra::Config& config,
                        EventChannel& events,
                        const CancellationSignal& cancel);

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    auto run() -> TransferSummary;

    [[nodiscard]] auto phase() const noexcept -> TransferPhase {
        return phase_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto request() const noexcept -> const TransferRequest& { return request_; }

private:
    auto copy_all(const TransferPlan& plan, TransferSummary& summary) -> void;
    auto finish(TransferSummary& summary) -> TransferSummary;
    auto fail(TransferSummary& summary, infra::Error&& error) -> TransferSummary;

    const TransferRequest request_;
    WorkerOptions options_;
    std::uint32_t pool_size_;
    EventChannel& events_;
    const CancellationSignal& cancel_;
    std::atomic<TransferPhase> phase_{TransferPhase::Idle};
};

} // namespace fxfer::core
