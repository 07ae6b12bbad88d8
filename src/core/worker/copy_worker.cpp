#include "copy_worker.hpp"
#include <spdlog/spdlog.h>
#include "../../extensions/metadata.hpp"

namespace fxfer::core {

CopyWorker::CopyWorker(const WorkerOptions& options,
                       ProgressAggregator& progress,
                       EventChannel& events,
                       const CancellationSignal& cancel)
    : options_(options), progress_(progress), events_(events), cancel_(cancel) {}

auto CopyWorker::run(const FileTask& task) const -> infra::Result<CopyOutcome>
{
    if (cancel_.requested()) {
        spdlog::trace("Dropping {}: transfer cancelled", task.source.string());
        return CopyOutcome::Dropped;
    }

    if (options_.skip_unchanged && adapters::fs::is_up_to_date(task.source, task.destination)) {
        spdlog::debug("Unchanged, skipping {}", task.destination.string());
        publish(task);
        return CopyOutcome::Unchanged;
    }

    auto res = copy_contents(task);
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }

    publish(task);
    return CopyOutcome::Copied;
}

auto CopyWorker::copy_contents(const FileTask& task) const -> infra::VoidResult
{
    auto dirs = adapters::fs::ensure_parent_directories(task.destination);
    if (!dirs) return dirs;

    const auto strategy = adapters::fs::select_strategy(task.size_bytes);
    auto copied = adapters::fs::copy_file(task.source, task.destination, strategy, options_.buffer_size);
    if (!copied) return copied;

    if (options_.preserve_metadata) {
        auto meta = extensions::copy_metadata(task.source, task.destination);
        if (!meta) return meta;
    }

    spdlog::trace("Copied {} -> {} ({} bytes)", task.source.string(), task.destination.string(), task.size_bytes);
    return {};
}

void CopyWorker::publish(const FileTask& task) const
{
    // Событие ставится в очередь под блокировкой агрегатора: проценты в канале не убывают
    progress_.add(task.size_bytes, [&](const ProgressSnapshot& snap) {
        events_.push(ProgressEvent{
            .percent = snap.percent,
            .file_name = task.source.filename().string()
        });
    });
}

} // namespace fxfer::core
