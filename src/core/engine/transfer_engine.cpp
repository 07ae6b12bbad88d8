#include "transfer_engine.hpp"
#include <chrono>
#include <future>
#include <system_error>
#include <thread>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../cancellation.hpp"
#include "../channel/event_channel.hpp"

namespace fxfer::core {

struct TransferEngine::Session {
    Session(TransferRequest request, const infra::Config& config)
        : coordinator(std::move(request), config, events, cancel) {}

    [[nodiscard]] bool finished() const {
        return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    EventChannel events;
    CancellationSignal cancel;
    TransferCoordinator coordinator;
    std::shared_future<TransferSummary> result;
    // Последним: поток завершается раньше, чем разрушаются канал и координатор
    std::jthread thread;
};

TransferEngine::TransferEngine(infra::Config config)
    : config_(std::move(config)) {}

TransferEngine::~TransferEngine() {
    std::unordered_map<TransferHandle, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [handle, session] : sessions) {
        if (!session->finished() && session->cancel.request()) {
            spdlog::debug("Cancelling transfer {} on shutdown ({})",
                          handle, to_string(session->coordinator.phase()));
        }
    }
    // jthread в каждой сессии делает join при разрушении
}

auto TransferEngine::start_transfer(const std::filesystem::path& source,
                                    const std::filesystem::path& destination)
    -> infra::Result<TransferHandle>
{
    if (source.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "Source path is not specified"));
    }
    if (destination.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "Destination path is not specified"));
    }

    auto session = std::make_shared<Session>(
        TransferRequest{.source = source, .destination_root = destination}, config_);

    std::promise<TransferSummary> promise;
    session->result = promise.get_future().share();

    TransferHandle handle = 0;
    {
        std::lock_guard lock(mutex_);
        handle = next_handle_++;
        sessions_.emplace(handle, session);
    }

    spdlog::debug("Starting transfer {}: {} -> {}", handle, source.string(), destination.string());
    try {
        session->thread = std::jthread([s = session.get(), p = std::move(promise)]() mutable {
            p.set_value(s->coordinator.run());
        });
    } catch (const std::system_error& e) {
        // Поток не создан: сессия не должна остаться с брошенным promise
        {
            std::lock_guard lock(mutex_);
            sessions_.erase(handle);
        }
        return std::unexpected(infra::log_and_return(infra::make_error(infra::ErrorCode::Unknown,
                               fmt::format("Cannot start transfer thread: {}", e.what()))));
    }
    return handle;
}

void TransferEngine::cancel(TransferHandle handle) {
    auto session = find(handle);
    if (!session || session->finished()) {
        return;
    }
    if (session->cancel.request()) {
        spdlog::info("Cancellation requested for transfer {}", handle);
    }
}

auto TransferEngine::poll_events(TransferHandle handle) -> std::vector<TransferEvent> {
    auto session = find(handle);
    if (!session) {
        return {};
    }
    return session->events.drain();
}

auto TransferEngine::is_active(TransferHandle handle) const -> bool {
    auto session = find(handle);
    return session && !session->finished();
}

auto TransferEngine::wait(TransferHandle handle) -> std::optional<TransferSummary> {
    auto session = find(handle);
    if (!session) {
        return std::nullopt;
    }
    return session->result.get();
}

void TransferEngine::release(TransferHandle handle) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(handle);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    // Последняя ссылка: деструктор сессии дождётся фонового потока
}

auto TransferEngine::find(TransferHandle handle) const -> std::shared_ptr<Session> {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(handle);
    return it != sessions_.end() ? it->second : nullptr;
}

} // namespace fxfer::core
