#pragma once

#include "http_client.hpp"

#include <string>

namespace modelfetch {

struct HttpOptions {
    long connect_timeout{30};
    // Abort when fewer than low_speed_limit bytes/s arrive for low_speed_time
    // seconds. 0 disables stall detection.
    long low_speed_time{0};
    long low_speed_limit{1};
    long buffer_size{1024 * 1024};
    std::string user_agent{"modelfetch/1.0"};
};

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options = {});

    ResponseHead head(const std::string& url, const AbortCheck& should_abort = {}) override;
    FetchResult get(const std::string& url,
                    const std::optional<ByteRange>& range,
                    const BodySink& sink,
                    const AbortCheck& should_abort = {}) override;

private:
    HttpOptions options_;
};

} // namespace modelfetch
