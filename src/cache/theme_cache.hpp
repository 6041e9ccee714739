// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_CACHE_THEME_CACHE_HPP
#define LIVETHEMES_CACHE_THEME_CACHE_HPP

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "theme/types.hpp"

namespace livethemes::cache {

/**
 * @brief Cache statistics
 */
struct CacheStats {
    size_t entries = 0;
    size_t hits = 0;
    size_t misses = 0;
};

/**
 * @brief Theme list cache with TTL support, persisted as a JSON file
 *
 * Each theme list is stored together with the time it was fetched. A list
 * is served from the cache while it is younger than the TTL. The backing
 * file is rewritten on every put; a missing or corrupt file starts an empty
 * cache.
 *
 * Thread-safe.
 */
class ThemeCache {
public:
    using Clock = std::chrono::system_clock;

    ThemeCache(std::filesystem::path file, std::chrono::milliseconds ttl);

    ThemeCache(const ThemeCache&) = delete;
    ThemeCache& operator=(const ThemeCache&) = delete;

    /**
     * @brief Get a cached theme list that has not expired
     */
    [[nodiscard]] auto get(const std::string& listFile,
                           Clock::time_point now = Clock::now())
        -> std::optional<std::vector<theme::Theme>>;

    /**
     * @brief Store a theme list fetched at @p now and persist the cache
     *
     * A cache file that cannot be written is logged; the entry is still
     * served from memory.
     */
    void put(const std::string& listFile,
             const std::vector<theme::Theme>& themes,
             Clock::time_point now = Clock::now());

    /**
     * @brief Drop all entries and remove the backing file
     */
    void clear();

    [[nodiscard]] auto getStats() const -> CacheStats;

    [[nodiscard]] auto ttl() const noexcept -> std::chrono::milliseconds {
        return ttl_;
    }

private:
    void load();
    void persist() const;

    std::filesystem::path file_;
    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    nlohmann::json entries_ = nlohmann::json::object();
    CacheStats stats_;
};

}  // namespace livethemes::cache

#endif  // LIVETHEMES_CACHE_THEME_CACHE_HPP
