// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "theme_cache.hpp"

#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

namespace livethemes::cache {

namespace {
auto toMillis(ThemeCache::Clock::time_point time) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}
}  // namespace

ThemeCache::ThemeCache(std::filesystem::path file,
                       std::chrono::milliseconds ttl)
    : file_(std::move(file)), ttl_(ttl) {
    load();
}

auto ThemeCache::get(const std::string& listFile, Clock::time_point now)
    -> std::optional<std::vector<theme::Theme>> {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(listFile);
    if (it == entries_.end()) {
        spdlog::debug("Cache miss for theme list: {}", listFile);
        stats_.misses++;
        return std::nullopt;
    }

    try {
        const auto age = toMillis(now) - it->value("timestamp", int64_t{0});
        if (age >= ttl_.count()) {
            spdlog::debug("Cache entry for {} expired ({} ms old)", listFile,
                          age);
            stats_.misses++;
            return std::nullopt;
        }

        auto themes = theme::themesFromJson(it->at("themes"));
        spdlog::debug("Cache hit for theme list: {}", listFile);
        stats_.hits++;
        return themes;
    } catch (const std::exception& e) {
        spdlog::warn("Dropping unreadable cache entry {}: {}", listFile,
                     e.what());
        entries_.erase(it);
        stats_.entries = entries_.size();
        stats_.misses++;
        return std::nullopt;
    }
}

void ThemeCache::put(const std::string& listFile,
                     const std::vector<theme::Theme>& themes,
                     Clock::time_point now) {
    std::lock_guard lock(mutex_);

    spdlog::debug("Caching {} themes for list: {}", themes.size(), listFile);
    entries_[listFile] = {{"themes", themes}, {"timestamp", toMillis(now)}};
    stats_.entries = entries_.size();
    persist();
}

void ThemeCache::clear() {
    std::lock_guard lock(mutex_);

    spdlog::info("Clearing theme cache");
    entries_ = nlohmann::json::object();
    stats_ = {};

    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec) {
        spdlog::warn("Failed to remove cache file {}: {}", file_.string(),
                     ec.message());
    }
}

auto ThemeCache::getStats() const -> CacheStats {
    std::lock_guard lock(mutex_);
    return stats_;
}

void ThemeCache::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        return;
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        spdlog::warn("Cannot open cache file {}, starting empty",
                     file_.string());
        return;
    }

    try {
        auto data = nlohmann::json::parse(in);
        if (!data.is_object()) {
            spdlog::warn("Cache file {} is not an object, starting empty",
                         file_.string());
            return;
        }
        entries_ = std::move(data);
        stats_.entries = entries_.size();
        spdlog::debug("Loaded {} cached theme lists from {}", entries_.size(),
                      file_.string());
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Corrupt cache file {}, starting empty: {}",
                     file_.string(), e.what());
    }
}

void ThemeCache::persist() const {
    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
    }

    std::ofstream out(file_, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::warn("Cannot write cache file {}, keeping entries in memory",
                     file_.string());
        return;
    }
    out << entries_.dump();
}

}  // namespace livethemes::cache
