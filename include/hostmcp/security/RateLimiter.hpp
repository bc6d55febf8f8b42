//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.hpp
// Purpose: Per-client sliding-window admission control
//==========================================================================================================

#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "hostmcp/errors/Errors.h"

namespace hostmcp::security {

//==========================================================================================================
// RateLimiter
// Purpose: Admits at most maxRequests per client within any trailing window.
// Notes:
//   Each client owns a bucket of request timestamps guarded by its own mutex; the table mutex is held
//   only to find or create a bucket, so distinct clients never contend on bucket updates.
//   Queries never create buckets; only admissions do.
//==========================================================================================================
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    RateLimiter(int maxRequests, std::chrono::seconds window, Clock clock = {});

    // Prunes expired entries; records and accepts when below the limit, otherwise rejects without recording.
    bool IsAllowed(const std::string& clientId);

    //==========================================================================================================
    // Admit
    // Purpose: IsAllowed expressed as a Status for the request pipeline.
    // Returns:
    //   Ok, or RateLimited with message "Rate limit exceeded. Retry after Ns" and data { retryAfter: N }.
    //==========================================================================================================
    errors::Status Admit(const std::string& clientId);

    int GetRemaining(const std::string& clientId);

    // Time until the oldest retained request leaves the window; zero when the bucket is empty.
    std::chrono::milliseconds GetResetTime(const std::string& clientId);

    // Clears the client's history and keeps its bucket; no-op for an unknown client.
    void Reset(const std::string& clientId);
    void ResetAll();

    // Removes the client's bucket entirely.
    void Forget(const std::string& clientId);

    // Number of clients currently holding a bucket.
    std::size_t ClientCount() const;

    int MaxRequests() const { return maxRequests; }
    std::chrono::seconds Window() const { return window; }

private:
    struct Bucket {
        std::mutex mutex;
        std::deque<std::chrono::steady_clock::time_point> stamps;
    };

    std::shared_ptr<Bucket> bucketFor(const std::string& clientId);
    std::shared_ptr<Bucket> findBucket(const std::string& clientId) const;
    void prune(Bucket& bucket, std::chrono::steady_clock::time_point now) const;

    int maxRequests;
    std::chrono::seconds window;
    Clock clock;

    mutable std::mutex tableMutex;
    std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets;
};

} // namespace hostmcp::security
