#pragma once

#include <cstddef>
#include "../types.hpp"
#include "../cancellation.hpp"
#include "../channel/event_channel.hpp"
#include "../progress/progress_aggregator.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fxfer::core {

enum class CopyOutcome {
    Copied,     // содержимое и метаданные скопированы
    Unchanged,  // skip_unchanged: получатель уже актуален
    Dropped,    // отмена до старта, ничего не сделано
};

struct WorkerOptions {
    std::size_t buffer_size = adapters::fs::kDefaultBufferSize;
    bool preserve_metadata = true;
    bool skip_unchanged = false;
};

/// Копирует один файл из плана.
///
/// Если отмена уже запрошена, задача отбрасывается без записи и без события.
/// Иначе создаются каталоги, копируется содержимое и метаданные, размер файла
/// из плана добавляется к общему прогрессу и публикуется ProgressEvent.
/// Ошибки ФС возвращаются вызывающему, а не глотаются.
class CopyWorker {
public:
    CopyWorker(const WorkerOptions& options,
               ProgressAggregator& progress,
               EventChannel& events,
               const CancellationSignal& cancel);

    [[nodiscard]] auto run(const FileTask& task) const -> infra::Result<CopyOutcome>;

private:
    [[nodiscard]] auto copy_contents(const FileTask& task) const -> infra::VoidResult;
    void publish(const FileTask& task) const;

    WorkerOptions options_;
    ProgressAggregator& progress_;
    EventChannel& events_;
    const CancellationSignal& cancel_;
};

} // namespace fxfer::core
