#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fxfer::core {

// Неизменяем после старта передачи
struct TransferRequest {
    std::filesystem::path source;
    std::filesystem::path destination_root;
};

// Одна единица работы: один файл. Создаётся планировщиком, потребляется одним worker'ом.
struct FileTask {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t size_bytes = 0;
};

struct TransferPlan {
    std::vector<FileTask> tasks;
    std::uint64_t total_bytes = 0;
    bool single_file = false; // источник является обычным файлом, пул не нужен
};

} // namespace fxfer::core
