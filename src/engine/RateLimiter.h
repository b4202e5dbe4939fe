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
#pragma once

/** @page rate_limiter Rate limiter

    The rate limiter is a set of token buckets, one for each remote
    endpoint (Const::SOURCE_BUCKET, Const::TARGET_BUCKET). A bucket is
    refilled with the configured number of tokens per second. Its
    capacity equals one second of refill. A rate of 0 disables the
    limitation for that endpoint.

    RateLimiter::acquire() blocks until the requested number of tokens
    is available. If that does not happen within the acquire timeout an
    exception with the error code Error::RATE_LIMIT_TIMEOUT is thrown
    which is classified as retryable.

    If a Cancellation is passed acquire() returns -1 as soon as it has
    been cancelled. RateLimiter::interrupt() has to be called after
    cancelling to wake up the waiting threads.
 */

class RateLimiter
{
private:
    struct bucket_t
    {
        double rate;
        double capacity;
        double tokens;
        std::chrono::steady_clock::time_point last;
        long waitTimeMs;
    };
    std::mutex mtx;
    std::condition_variable cond;
    std::map<std::string, bucket_t> buckets;
    std::chrono::milliseconds acquireTimeout;

    void refill(bucket_t *bucket, std::chrono::steady_clock::time_point now);
public:
    RateLimiter(long acquireTimeoutMs = Const::DEFAULT_ACQUIRE_TIMEOUT_MS) :
            acquireTimeout(acquireTimeoutMs)
    {
    }
    void addBucket(std::string name, double tokensPerSecond);
    long acquire(std::string name, double cost = 1, Cancellation *cancel =
            nullptr);
    void interrupt();
    long getWaitTime(std::string name);
};
