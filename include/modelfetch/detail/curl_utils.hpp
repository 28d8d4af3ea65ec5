#pragma once

#include <memory>

#include <curl/curl.h>

namespace modelfetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

} // namespace modelfetch::detail
