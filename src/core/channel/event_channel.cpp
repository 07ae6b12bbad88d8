#include "event_channel.hpp"
#include <iterator>

namespace fxfer::core {

void EventChannel::push(TransferEvent event) {
    std::lock_guard lock(mutex_);
    events_.push_back(std::move(event));
}

auto EventChannel::drain() -> std::vector<TransferEvent> {
    std::deque<TransferEvent> pending;
    {
        std::lock_guard lock(mutex_);
        pending.swap(events_);
    }
    return std::vector<TransferEvent>(std::make_move_iterator(pending.begin()),
                                      std::make_move_iterator(pending.end()));
}

} // namespace fxfer::core
