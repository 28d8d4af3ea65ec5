#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include <jsoncpp/json/json.h>

namespace modelfetch {

enum class EventKind {
    Progress,
    Complete,
    Error,
    Cancelled
};

struct DownloadEvent {
    EventKind kind{EventKind::Progress};
    std::string download_id;
    double progress{0.0};
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    std::string path;
    std::string error;
};

// Push channel name, e.g. "server_download_progress".
[[nodiscard]] const char* eventName(EventKind kind);
[[nodiscard]] Json::Value toJson(const DownloadEvent& event);

/**
 * Best-effort publish/subscribe. Listeners run on the publishing thread; a
 * listener that throws is logged and skipped.
 */
class EventBus {
public:
    using Listener = std::function<void(const DownloadEvent&)>;
    using Token = std::size_t;

    Token subscribe(Listener listener);
    void unsubscribe(Token token);
    void publish(const DownloadEvent& event) const;

private:
    mutable std::mutex mutex_;
    std::map<Token, Listener> listeners_;
    Token next_token_{1};
};

} // namespace modelfetch
