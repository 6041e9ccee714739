// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "http_client.hpp"

#include <mutex>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace livethemes::client {

namespace {
std::once_flag curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(curlInitFlag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}
}  // namespace

HttpClient::HttpClient(HttpClientConfig config)
    : config_(std::move(config)), curl_(nullptr, curl_easy_cleanup) {
    ensureCurlInitialized();
    curl_.reset(curl_easy_init());
    if (!curl_) {
        throw NetworkException("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() = default;

auto HttpClient::writeCallback(char* ptr, size_t size, size_t nmemb,
                               void* userdata) -> size_t {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

auto HttpClient::resolveUrl(const std::string& baseUrl,
                            const std::string& path) -> std::string {
    if (path.starts_with("http://") || path.starts_with("https://")) {
        return path;
    }

    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (!path.starts_with('/')) {
        url.push_back('/');
    }
    url += path;
    return url;
}

auto HttpClient::get(const std::string& path) -> std::string {
    const std::string url = resolveUrl(config_.baseUrl, path);
    std::string body;

    CURL* curl = curl_.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpClient::writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                     config_.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER,
                     config_.verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST,
                     config_.verifySSL ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    spdlog::debug("GET {}", url);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw NetworkException(
            fmt::format("GET {} failed: {}", url, curl_easy_strerror(res)),
            static_cast<int>(res));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw NetworkException(
            fmt::format("GET {} returned HTTP {}", url, status), 0, status);
    }

    spdlog::debug("GET {} -> {} bytes", url, body.size());
    return body;
}

}  // namespace livethemes::client
