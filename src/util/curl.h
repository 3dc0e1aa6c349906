#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <util/expected.h>

#include <curl/curl.h>
#include <curl/easy.h>

namespace util {
namespace curl {

struct error {
    CURLcode code;
    std::string message;
};

struct basic_auth {
    std::string username;
    std::string password;
};

// perform a HEAD request, returning the HTTP status code of the response.
// an HTTP error status (4xx, 5xx) is not an error: only failures to make the
// request, e.g. a connection or time out error, are returned as error.
expected<long, error> head(const std::string& url, const basic_auth& auth,
                           const std::vector<std::string>& headers,
                           std::chrono::milliseconds timeout);

} // namespace curl
} // namespace util
