// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_CLIENT_CONTENT_FETCHER_HPP
#define LIVETHEMES_CLIENT_CONTENT_FETCHER_HPP

#include <string>

namespace livethemes::client {

/**
 * @brief Source of raw response bodies from the theme server
 */
class ContentFetcher {
public:
    virtual ~ContentFetcher() = default;

    /**
     * @brief Fetch a resource body
     * @param path Path relative to the server base URL, or an absolute URL
     * @return Response body
     * @throws NetworkException on transport errors or non-2xx responses
     */
    virtual auto get(const std::string& path) -> std::string = 0;
};

}  // namespace livethemes::client

#endif  // LIVETHEMES_CLIENT_CONTENT_FETCHER_HPP
