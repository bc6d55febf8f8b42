//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hostmcp/security/RateLimiter.cpp
// Purpose: Sliding-window rate limiter implementation
//==========================================================================================================

#include <format>

#include "hostmcp/security/RateLimiter.hpp"
#include "logging/Logger.h"

namespace hostmcp::security {

RateLimiter::RateLimiter(int maxRequests, std::chrono::seconds window, Clock clock)
    : maxRequests(maxRequests), window(window), clock(std::move(clock)) {
    if (!this->clock) {
        this->clock = [](){ return std::chrono::steady_clock::now(); };
    }
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::bucketFor(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(tableMutex);
    auto& slot = buckets[clientId];
    if (!slot) {
        slot = std::make_shared<Bucket>();
    }
    return slot;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::findBucket(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(tableMutex);
    auto it = buckets.find(clientId);
    return it == buckets.end() ? nullptr : it->second;
}

void RateLimiter::prune(Bucket& bucket, std::chrono::steady_clock::time_point now) const {
    const auto cutoff = now - window;
    while (!bucket.stamps.empty() && bucket.stamps.front() <= cutoff) {
        bucket.stamps.pop_front();
    }
}

bool RateLimiter::IsAllowed(const std::string& clientId) {
    auto bucket = bucketFor(clientId);
    std::lock_guard<std::mutex> lock(bucket->mutex);
    const auto now = clock();
    prune(*bucket, now);
    if (static_cast<int>(bucket->stamps.size()) >= maxRequests) {
        return false;
    }
    bucket->stamps.push_back(now);
    return true;
}

errors::Status RateLimiter::Admit(const std::string& clientId) {
    if (IsAllowed(clientId)) {
        return errors::okStatus();
    }
    const auto reset = GetResetTime(clientId);
    // Whole seconds, rounded up
    const int64_t retryAfter = (reset.count() + 999) / 1000;
    LOG_WARN("Rate limit exceeded for client '{}' (retry after {}s)", clientId, retryAfter);
    JSONValue::Object data;
    data["retryAfter"] = std::make_shared<JSONValue>(retryAfter);
    return errors::makeError(errors::ErrorKind::RateLimited,
                             std::format("Rate limit exceeded. Retry after {}s", retryAfter),
                             JSONValue(data));
}

int RateLimiter::GetRemaining(const std::string& clientId) {
    auto bucket = findBucket(clientId);
    if (!bucket) {
        return maxRequests;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    prune(*bucket, clock());
    const int used = static_cast<int>(bucket->stamps.size());
    return used >= maxRequests ? 0 : maxRequests - used;
}

std::chrono::milliseconds RateLimiter::GetResetTime(const std::string& clientId) {
    auto bucket = findBucket(clientId);
    if (!bucket) {
        return std::chrono::milliseconds(0);
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    const auto now = clock();
    prune(*bucket, now);
    if (bucket->stamps.empty()) {
        return std::chrono::milliseconds(0);
    }
    const auto remaining = bucket->stamps.front() + window - now;
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining);
    return ms.count() < 0 ? std::chrono::milliseconds(0) : ms;
}

void RateLimiter::Reset(const std::string& clientId) {
    auto bucket = findBucket(clientId);
    if (!bucket) {
        return;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    bucket->stamps.clear();
}

void RateLimiter::ResetAll() {
    std::lock_guard<std::mutex> lock(tableMutex);
    for (auto& [client, bucket] : buckets) {
        std::lock_guard<std::mutex> bucketLock(bucket->mutex);
        bucket->stamps.clear();
    }
}

void RateLimiter::Forget(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(tableMutex);
    if (buckets.erase(clientId) > 0) {
        LOG_DEBUG("Rate limit state dropped for client '{}'", clientId);
    }
}

std::size_t RateLimiter::ClientCount() const {
    std::lock_guard<std::mutex> lock(tableMutex);
    return buckets.size();
}

} // namespace hostmcp::security
