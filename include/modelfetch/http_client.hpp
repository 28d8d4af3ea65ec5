#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace modelfetch {

struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
};

struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::string accept_ranges;
    std::string content_range;
};

struct FetchResult {
    ResponseHead head;
    bool aborted{false};
};

// Receives each body increment as it arrives. Returning false aborts the transfer.
using BodySink = std::function<bool(const ResponseHead& head, const char* data, std::size_t size)>;

// Polled while the connection is idle; returning true aborts the transfer.
using AbortCheck = std::function<bool()>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Metadata-only request, redirects followed. Network faults, and an abort
    // requested by `should_abort`, throw TransferError.
    virtual ResponseHead head(const std::string& url, const AbortCheck& should_abort = {}) = 0;

    // Streams the body of a GET (optionally ranged) into `sink`. Network faults
    // throw TransferError; an abort requested by the sink or by `should_abort`
    // is reported through FetchResult::aborted instead.
    virtual FetchResult get(const std::string& url,
                            const std::optional<ByteRange>& range,
                            const BodySink& sink,
                            const AbortCheck& should_abort = {}) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace modelfetch
