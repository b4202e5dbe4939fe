/*******************************************************************************
 * Copyright 2018 IBM Corp. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *  https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 *******************************************************************************/
#include "EngineIncludes.h"

void RateLimiter::addBucket(std::string name, double tokensPerSecond)

{
    std::lock_guard<std::mutex> lock(mtx);
    bucket_t bucket;

    if (tokensPerSecond < 0)
        THROW(Error::CONFIG_VALUE_ERROR, name, tokensPerSecond);

    bucket.rate = tokensPerSecond;
    bucket.capacity = tokensPerSecond > 1 ? tokensPerSecond : 1;
    bucket.tokens = bucket.capacity;
    bucket.last = std::chrono::steady_clock::now();
    bucket.waitTimeMs = 0;

    buckets[name] = bucket;

    TRACE(Trace::normal, name, tokensPerSecond);
}

void RateLimiter::refill(bucket_t *bucket,
        std::chrono::steady_clock::time_point now)

{
    std::chrono::duration<double> elapsed = now - bucket->last;

    bucket->tokens += elapsed.count() * bucket->rate;
    if (bucket->tokens > bucket->capacity)
        bucket->tokens = bucket->capacity;
    bucket->last = now;
}

long RateLimiter::acquire(std::string name, double cost,
        Cancellation *cancel)

{
    std::unique_lock<std::mutex> lock(mtx);
    std::chrono::steady_clock::time_point start =
            std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point deadline = start + acquireTimeout;
    std::chrono::steady_clock::time_point now;
    long waited;
    double needed;

    auto it = buckets.find(name);
    if (it == buckets.end()) {
        TRACE(Trace::error, name);
        THROW(Error::GENERAL_ERROR, name);
    }

    bucket_t& bucket = it->second;

    if (bucket.rate == 0)
        return 0;

    // a request larger than the capacity waits for a full bucket
    needed = cost < bucket.capacity ? cost : bucket.capacity;

    while (true) {
        now = std::chrono::steady_clock::now();
        refill(&bucket, now);

        if (bucket.tokens >= needed) {
            bucket.tokens -= cost;
            break;
        }

        if (cancel != nullptr && cancel->isCancelled()) {
            waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - start).count();
            bucket.waitTimeMs += waited;
            TRACE(Trace::normal, name, cost, waited);
            return -1;
        }

        if (now >= deadline) {
            waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - start).count();
            bucket.waitTimeMs += waited;
            TRACE(Trace::error, name, cost, waited);
            THROW(Error::RATE_LIMIT_TIMEOUT, name, waited);
        }

        std::chrono::duration<double> missing((needed - bucket.tokens)
                / bucket.rate);
        std::chrono::steady_clock::time_point until = now
                + std::chrono::duration_cast<
                        std::chrono::steady_clock::duration>(missing);

        cond.wait_until(lock, until < deadline ? until : deadline);
    }

    waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    bucket.waitTimeMs += waited;

    if (waited > 0)
        TRACE(Trace::full, name, cost, waited);

    return waited;
}

void RateLimiter::interrupt()

{
    std::lock_guard<std::mutex> lock(mtx);

    cond.notify_all();
}

long RateLimiter::getWaitTime(std::string name)

{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = buckets.find(name);

    if (it == buckets.end())
        return 0;

    return it->second.waitTimeMs;
}
