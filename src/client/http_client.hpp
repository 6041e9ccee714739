// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_CLIENT_HTTP_CLIENT_HPP
#define LIVETHEMES_CLIENT_HTTP_CLIENT_HPP

#include <chrono>
#include <memory>
#include <string>

#include <curl/curl.h>

#include "content_fetcher.hpp"

namespace livethemes::client {

/**
 * @brief HTTP client configuration
 */
struct HttpClientConfig {
    std::string baseUrl;
    std::chrono::milliseconds timeout{30000};
    std::string userAgent = "live-themes/1.0";
    bool followRedirects = true;
    bool verifySSL = true;
};

/**
 * @brief Blocking libcurl client for the theme server
 *
 * Not thread-safe; each thread should own its own client.
 */
class HttpClient : public ContentFetcher {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    auto get(const std::string& path) -> std::string override;

    /**
     * @brief Resolve @p path against the base URL
     *
     * Absolute http(s) URLs are returned unchanged. Otherwise exactly one
     * slash joins the base URL and the path.
     */
    [[nodiscard]] static auto resolveUrl(const std::string& baseUrl,
                                         const std::string& path)
        -> std::string;

private:
    static auto writeCallback(char* ptr, size_t size, size_t nmemb,
                              void* userdata) -> size_t;

    HttpClientConfig config_;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

}  // namespace livethemes::client

#endif  // LIVETHEMES_CLIENT_HTTP_CLIENT_HPP
