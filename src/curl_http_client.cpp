// SPDX-License-Identifier: Apache-2.0
#include "curl_http_client.hpp"

#include <curl/curl.h>
#include <everest/logging.hpp>

#include <algorithm>
#include <memory>
#include <mutex>

namespace evselink {

namespace {

std::size_t append_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpClient::CurlHttpClient() {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResult CurlHttpClient::perform(const HttpRequest& request) {
    HttpResult result;
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        result.error = TransportError{ErrorKind::TransportOpen, "curl_easy_init failed", std::nullopt};
        return result;
    }

    curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        const auto line = name + ": " + value;
        if (auto* next = curl_slist_append(header_list, line.c_str())) {
            header_list = next;
        }
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(header_list);

    const long timeout_ms = std::max<long>(1, static_cast<long>(request.timeout.count()));
    std::string body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const auto kind = res == CURLE_OPERATION_TIMEDOUT ? ErrorKind::TransportTimeout : ErrorKind::TransportOpen;
        EVLOG_debug << request.method << " " << request.url << " failed: " << curl_easy_strerror(res);
        result.error = TransportError{kind, curl_easy_strerror(res), std::nullopt};
        return result;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    result.response = HttpResponse{status, std::move(body)};
    return result;
}

} // namespace evselink
