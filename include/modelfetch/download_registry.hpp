#pragma once

#include "download_status.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace modelfetch {

/**
 * Thread-safe map of download id to status record. Every admission gets a
 * fresh generation; writers pass the generation they were admitted with so a
 * finishing transfer never touches an entry that was since resubmitted.
 */
class DownloadRegistry {
public:
    using Mutator = std::function<void(DownloadStatus&)>;

    // Inserts or replaces the entry for status.id. Returns its generation.
    std::uint64_t admit(DownloadStatus status);

    [[nodiscard]] std::optional<DownloadStatus> get(const std::string& id) const;
    [[nodiscard]] std::map<std::string, DownloadStatus> all() const;

    // Runs `mutator` under the lock if the entry exists, matches `generation`
    // and is not terminal.
    bool update(const std::string& id, std::uint64_t generation, const Mutator& mutator);

    // Forward-only state change. Returns false if the entry is missing, from
    // another generation, already terminal, or `next` would move backwards.
    bool transition(const std::string& id, std::uint64_t generation, DownloadState next,
                    const Mutator& mutator = {});

    // Like transition() for whatever generation is current.
    bool transition(const std::string& id, DownloadState next, const Mutator& mutator = {});

private:
    bool transitionLocked(DownloadStatus& status, DownloadState next, const Mutator& mutator);

    mutable std::mutex mutex_;
    std::map<std::string, DownloadStatus> entries_;
    std::uint64_t next_generation_{1};
};

} // namespace modelfetch
