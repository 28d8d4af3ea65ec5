#include "modelfetch/curl_http_client.hpp"
#include "modelfetch/detail/curl_utils.hpp"
#include "modelfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace modelfetch {

namespace {

struct TransferContext {
    CURL* curl{nullptr};
    ResponseHead head;
    const BodySink* sink{nullptr};
    const AbortCheck* should_abort{nullptr};
    bool aborted{false};
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nitems;
    const std::string line(buffer, total);

    // A new status line means a redirect hop; drop headers of the previous response.
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->head = ResponseHead{};
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    const std::string name = toLower(trim(line.substr(0, colon)));
    const std::string value = trim(line.substr(colon + 1));
    if (name == "content-length") {
        try {
            ctx->head.content_length = std::stoull(value);
        } catch (const std::exception&) {
            ctx->head.content_length.reset();
        }
    } else if (name == "accept-ranges") {
        ctx->head.accept_ranges = toLower(value);
    } else if (name == "content-range") {
        ctx->head.content_range = value;
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (ctx->head.status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->head.status);
    }
    if (ctx->sink && *ctx->sink && !(*ctx->sink)(ctx->head, ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    if (ctx->should_abort && *ctx->should_abort && (*ctx->should_abort)()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

} // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

ResponseHead CurlHttpClient::head(const std::string& url, const AbortCheck& should_abort) {
    detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransferError("Failed to allocate curl handle");
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.should_abort = &should_abort;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.aborted) {
        throw TransferError("HEAD request aborted");
    }
    if (res != CURLE_OK) {
        throw TransferError(std::string{"curl error: "} + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.head.status);
    if (!ctx.head.content_length) {
        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length >= 0) {
            ctx.head.content_length = static_cast<std::uint64_t>(length);
        }
    }
    return ctx.head;
}

FetchResult CurlHttpClient::get(const std::string& url,
                                const std::optional<ByteRange>& range,
                                const BodySink& sink,
                                const AbortCheck& should_abort) {
    detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransferError("Failed to allocate curl handle");
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.sink = &sink;
    ctx.should_abort = &should_abort;

    std::string range_spec;
    if (range) {
        range_spec = fmt::format("{}-{}", range->start, range->end);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range_spec.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, options_.buffer_size);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    if (options_.low_speed_time > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.low_speed_time);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.head.status == 0) {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.head.status);
    }

    if (ctx.aborted) {
        return {ctx.head, true};
    }
    if (res != CURLE_OK) {
        throw TransferError(std::string{"curl error: "} + curl_easy_strerror(res));
    }
    return {ctx.head, false};
}

} // namespace modelfetch
