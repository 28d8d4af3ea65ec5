#include "modelfetch/download_registry.hpp"

#include <utility>

namespace modelfetch {

namespace {

int rank(DownloadState state) {
    switch (state) {
    case DownloadState::Queued:
        return 0;
    case DownloadState::Downloading:
        return 1;
    default:
        return 2;
    }
}

} // namespace

std::uint64_t DownloadRegistry::admit(DownloadStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status.generation = next_generation_++;
    const std::uint64_t generation = status.generation;
    const std::string id = status.id;
    entries_[id] = std::move(status);
    return generation;
}

std::optional<DownloadStatus> DownloadRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, DownloadStatus> DownloadRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool DownloadRegistry::update(const std::string& id, std::uint64_t generation, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.generation != generation || isTerminal(it->second.state)) {
        return false;
    }
    mutator(it->second);
    return true;
}

bool DownloadRegistry::transition(const std::string& id, std::uint64_t generation, DownloadState next,
                                  const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.generation != generation) {
        return false;
    }
    return transitionLocked(it->second, next, mutator);
}

bool DownloadRegistry::transition(const std::string& id, DownloadState next, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    return transitionLocked(it->second, next, mutator);
}

bool DownloadRegistry::transitionLocked(DownloadStatus& status, DownloadState next, const Mutator& mutator) {
    if (isTerminal(status.state) || rank(next) < rank(status.state)) {
        return false;
    }
    status.state = next;
    if (isTerminal(next)) {
        status.paused = false;
    }
    if (mutator) {
        mutator(status);
    }
    return true;
}

} // namespace modelfetch
