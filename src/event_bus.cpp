#include "modelfetch/event_bus.hpp"
#include "modelfetch/logger.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace modelfetch {

const char* eventName(EventKind kind) {
    switch (kind) {
    case EventKind::Progress:
        return "server_download_progress";
    case EventKind::Complete:
        return "server_download_complete";
    case EventKind::Error:
        return "server_download_error";
    case EventKind::Cancelled:
        return "server_download_cancelled";
    }
    return "server_download_unknown";
}

Json::Value toJson(const DownloadEvent& event) {
    Json::Value obj(Json::objectValue);
    obj["download_id"] = event.download_id;
    switch (event.kind) {
    case EventKind::Progress:
        obj["progress"] = event.progress;
        obj["downloaded"] = Json::UInt64(event.downloaded);
        obj["total"] = Json::UInt64(event.total);
        break;
    case EventKind::Complete:
        obj["path"] = event.path;
        obj["size"] = Json::UInt64(event.total);
        break;
    case EventKind::Error:
        obj["error"] = event.error;
        break;
    case EventKind::Cancelled:
        break;
    }
    return obj;
}

EventBus::Token EventBus::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Token token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void EventBus::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

void EventBus::publish(const DownloadEvent& event) const {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            detail::log(spdlog::level::warn, "Event listener failed for {} ({}): {}",
                        event.download_id, eventName(event.kind), ex.what());
        }
    }
}

} // namespace modelfetch
