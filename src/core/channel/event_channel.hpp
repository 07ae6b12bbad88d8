#pragma once

#include <deque>
#include <mutex>
#include <vector>
#include "transfer_event.hpp"

namespace fxfer::core {

/// Неограниченная FIFO-очередь событий: много производителей, один потребитель.
/// push никогда не ждёт ничего, кроме короткой блокировки; потребитель
/// забирает события без ожидания через drain.
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void push(TransferEvent event);

    // Все события, накопленные с прошлого вызова; пустой вектор, если их нет
    [[nodiscard]] auto drain() -> std::vector<TransferEvent>;

private:
    std::deque<TransferEvent> events_;
    std::mutex mutex_;
};

} // namespace fxfer::core
