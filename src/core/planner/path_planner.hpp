#pragma once

#include <filesystem>
#include "../types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fxfer::core {

/// Обходит источник и строит полный план передачи до начала копирования.
///
/// Файл-источник даёт одну задачу `destination_root / имя_файла`.
/// Каталог-источник даёт по задаче на каждый обычный файл в дереве,
/// с сохранением структуры под `destination_root / имя_каталога / ...`.
/// Задачи отсортированы по пути источника. Планирование ничего не пишет на диск.
///
/// Ошибки: SourceNotFound, EmptySource, InvalidPath, либо ошибка ФС при обходе.
class PathPlanner {
public:
    [[nodiscard]] auto plan(const TransferRequest& request) const -> infra::Result<TransferPlan>;

private:
    [[nodiscard]] auto plan_directory(const std::filesystem::path& source,
                                      const std::filesystem::path& destination) const
        -> infra::Result<TransferPlan>;
};

} // namespace fxfer::core
