#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <curl/easy.h>
#include <spdlog/spdlog.h>

#include <util/curl.h>
#include <util/defer.h>
#include <util/expected.h>

namespace util {

namespace curl {

#define CURL_EASY(CMD)                                                         \
    if (auto rval__ = CMD; rval__ != CURLE_OK) {                               \
        return util::unexpected(error{                                         \
            rval__, errbuf[0] ? errbuf : curl_easy_strerror(rval__)});         \
    }

// curl_global_init is not thread safe, and must be called before
// curl_easy_init is called from more than one thread.
static void global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static size_t discard_callback(void*, size_t size, size_t n, void*) {
    return size * n;
}

expected<long, error> head(const std::string& url, const basic_auth& auth,
                           const std::vector<std::string>& headers,
                           std::chrono::milliseconds timeout) {
    global_init();

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = 0;

    auto h = curl_easy_init();
    if (!h) {
        return unexpected{
            error{CURLE_FAILED_INIT, "unable to initialise curl"}};
    }
    auto _ = defer([h]() { curl_easy_cleanup(h); });

    struct curl_slist* header_list = nullptr;
    auto _headers = defer([&header_list]() {
        if (header_list) {
            curl_slist_free_all(header_list);
        }
    });
    for (auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    CURL_EASY(curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf));

    CURL_EASY(curl_easy_setopt(h, CURLOPT_URL, url.c_str()));
    spdlog::trace("curl::head set url {}", url);

    CURL_EASY(curl_easy_setopt(h, CURLOPT_NOBODY, 1L));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discard_callback));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list));

    // some servers do not like requests that are made without a user-agent
    // field, so we provide one
    CURL_EASY(curl_easy_setopt(h, CURLOPT_USERAGENT, "libcurl-agent/1.0"));

    CURL_EASY(curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_USERNAME, auth.username.c_str()));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_PASSWORD, auth.password.c_str()));
    spdlog::trace("curl::head set credentials");

    // the handle is used from worker threads: signals must not be used to
    // implement time outs in name resolution.
    CURL_EASY(curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, 10000L));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                               static_cast<long>(timeout.count())));
    spdlog::trace("curl::head set timeout {}", timeout.count());

    CURL_EASY(curl_easy_perform(h));

    long http_code = 0;
    CURL_EASY(curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code));
    spdlog::trace("curl::head http_code: {}", http_code);

    return http_code;
}

} // namespace curl
} // namespace util
