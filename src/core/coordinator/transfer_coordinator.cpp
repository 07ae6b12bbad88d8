#include "transfer_coordinator.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../planner/path_planner.hpp"
#include "../progress/progress_aggregator.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace fxfer::core {

std::string_view to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Idle:      return "idle";
        case TransferPhase::Planning:  return "planning";
        case TransferPhase::Copying:   return "copying";
        case TransferPhase::Completed: return "completed";
        case TransferPhase::Cancelled: return "cancelled";
        case TransferPhase::Failed:    return "failed";
    }
    return "unknown";
}

TransferCoordinator::TransferCoordinator(TransferRequest request,
                                         const infra::Config& config,
                                         EventChannel& events,
                                         const CancellationSignal& cancel)
    : request_(std::move(request))
    , options_{
        .buffer_size = config.buffer_size.value_or(adapters::fs::kDefaultBufferSize),
        .preserve_metadata = config.preserve_metadata,
        .skip_unchanged = config.skip_unchanged
      }
    , pool_size_(config.pool_size())
    , events_(events)
    , cancel_(cancel) {}

auto TransferCoordinator::run() -> TransferSummary
{
    TransferSummary summary;

    try {
        phase_.store(TransferPhase::Planning, std::memory_order_release);
        spdlog::info("Planning transfer {} -> {}", request_.source.string(), request_.destination_root.string());

        auto plan = PathPlanner{}.plan(request_);
        if (!plan) {
            return fail(summary, std::move(plan.error()));
        }

        summary.files_planned = plan->tasks.size();
        summary.total_bytes = plan->total_bytes;

        phase_.store(TransferPhase::Copying, std::memory_order_release);
        copy_all(*plan, summary);
        return finish(summary);

    } catch (const std::exception& e) {
        // bad_alloc и filesystem_error не должны оставить потребителя без терминального события
        return fail(summary, infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Transfer aborted: {}", e.what())));
    }
}

auto TransferCoordinator::copy_all(const TransferPlan& plan, TransferSummary& summary) -> void
{
    ProgressAggregator progress(plan.total_bytes);
    CopyWorker worker(options_, progress, events_, cancel_);

    std::atomic<std::uint64_t> copied{0};
    std::atomic<std::uint64_t> unchanged{0};
    std::atomic<std::uint64_t> dropped{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;

    auto execute = [&](const FileTask& task) {
        // После первой ошибки новые задачи не начинаются
        if (failed.load(std::memory_order_acquire)) {
            dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        infra::Result<CopyOutcome> res = CopyOutcome::Dropped;
        try {
            res = worker.run(task);
        } catch (const std::exception& e) {
            res = std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                                  fmt::format("Copying {} failed: {}", task.source.string(), e.what())));
        }

        if (!res) {
            std::lock_guard lock(error_mutex);
            if (!summary.error) {
                summary.error = infra::log_and_return(std::move(res.error()));
                failed.store(true, std::memory_order_release);
            } else {
                spdlog::warn("Additional failure ignored: {}", res.error().message);
            }
            return;
        }

        switch (*res) {
            case CopyOutcome::Copied:    copied.fetch_add(1, std::memory_order_relaxed); break;
            case CopyOutcome::Unchanged: unchanged.fetch_add(1, std::memory_order_relaxed); break;
            case CopyOutcome::Dropped:   dropped.fetch_add(1, std::memory_order_relaxed); break;
        }
    };

    if (plan.single_file) {
        // Один файл: пул не нужен, копируем в потоке координатора
        summary.pool_size = 0;
        execute(plan.tasks.front());
    } else {
        const auto threads = static_cast<std::uint32_t>(
            std::min<std::size_t>(pool_size_, plan.tasks.size()));
        infra::ThreadPool pool{threads};
        summary.pool_size = static_cast<std::uint32_t>(pool.size());
        spdlog::info("Copying {} files ({} bytes) with {} workers",
                     plan.tasks.size(), plan.total_bytes, summary.pool_size);

        for (const auto& task : plan.tasks) {
            pool.enqueue([&execute, &task]() { execute(task); });
        }
        pool.wait();
    }

    summary.files_copied = copied.load();
    summary.files_unchanged = unchanged.load();
    summary.files_dropped = dropped.load();
    summary.copied_bytes = progress.snapshot().copied_bytes;
}

auto TransferCoordinator::finish(TransferSummary& summary) -> TransferSummary
{
    if (summary.error) {
        summary.phase = TransferPhase::Failed;
        events_.push(ErrorEvent{.message = summary.error->message});
    } else if (cancel_.requested()) {
        summary.phase = TransferPhase::Cancelled;
        events_.push(CancelledEvent{});
    } else {
        summary.phase = TransferPhase::Completed;
        events_.push(DoneEvent{});
    }
    phase_.store(summary.phase, std::memory_order_release);

    spdlog::info("Transfer {}: {} copied, {} unchanged, {} dropped, {}/{} bytes",
                 to_string(summary.phase),
                 summary.files_copied, summary.files_unchanged, summary.files_dropped,
                 summary.copied_bytes, summary.total_bytes);
    return summary;
}

auto TransferCoordinator::fail(TransferSummary& summary, infra::Error&& error) -> TransferSummary
{
    summary.error = infra::log_and_return(std::move(error));
    summary.phase = TransferPhase::Failed;
    events_.push(ErrorEvent{.message = summary.error->message});
    phase_.store(TransferPhase::Failed, std::memory_order_release);
    return summary;
}

} // namespace fxfer::core
