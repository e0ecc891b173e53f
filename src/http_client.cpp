// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "http_client.h"
#include "util.h"
#include "version.h"

#include <curl/curl.h>

namespace sonix {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* buf = static_cast<std::string*>(userp);
    buf->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlInit {
    CurlInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlInit() { curl_global_cleanup(); }
};

void ensure_curl() {
    static CurlInit init;
}

} // anonymous namespace

std::map<std::string, std::string> bearer_headers(const std::string& token) {
    if (token.empty()) return {};
    return {{"Authorization", "Bearer " + token}};
}

std::string http_get(const std::string& url,
                     const std::map<std::string, std::string>& headers,
                     long timeout_sec) {
    ensure_curl();

    CURL* curl = curl_easy_init();
    if (!curl) throw SonixError("curl_easy_init failed");

    static const std::string ua = std::string("sonix/") + SONIX_VERSION;
    std::string response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, ua.c_str());

    struct curl_slist* hdr_list = nullptr;
    for (const auto& [key, val] : headers)
        hdr_list = curl_slist_append(hdr_list, (key + ": " + val).c_str());
    if (hdr_list)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdr_list);

    CURLcode res = curl_easy_perform(curl);
    if (hdr_list) curl_slist_free_all(hdr_list);

    if (res != CURLE_OK) {
        std::string err = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw SonixError("HTTP GET failed: " + err + " (" + url + ")");
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code >= 400)
        throw SonixError("HTTP GET " + std::to_string(http_code) + ": " + url);
    return response;
}

} // namespace sonix
