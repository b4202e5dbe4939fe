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
#include <gtest/gtest.h>

#include "src/engine/EngineIncludes.h"

TEST(RateLimiter, ZeroRateIsUnlimited)
{
    RateLimiter limiter(10);

    limiter.addBucket(Const::SOURCE_BUCKET, 0);

    for (int i = 0; i < 1000; i++)
        EXPECT_EQ(0, limiter.acquire(Const::SOURCE_BUCKET));

    EXPECT_EQ(0, limiter.getWaitTime(Const::SOURCE_BUCKET));
}

TEST(RateLimiter, BurstUpToOneSecondOfRefill)
{
    RateLimiter limiter(5000);
    auto start = std::chrono::steady_clock::now();

    limiter.addBucket(Const::TARGET_BUCKET, 20);

    // the full bucket serves 20 requests at once, the next 10 need ~0.5s
    for (int i = 0; i < 30; i++)
        limiter.acquire(Const::TARGET_BUCKET);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    EXPECT_GE(elapsed, 400);
    EXPECT_LT(elapsed, 3000);
    EXPECT_GE(limiter.getWaitTime(Const::TARGET_BUCKET), 400);
}

TEST(RateLimiter, BucketsAreIndependent)
{
    RateLimiter limiter(5000);

    limiter.addBucket(Const::SOURCE_BUCKET, 1);
    limiter.addBucket(Const::TARGET_BUCKET, 0);

    limiter.acquire(Const::SOURCE_BUCKET);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 100; i++)
        limiter.acquire(Const::TARGET_BUCKET);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    EXPECT_LT(elapsed, 500);
    EXPECT_EQ(0, limiter.getWaitTime(Const::TARGET_BUCKET));
}

TEST(RateLimiter, AcquireTimesOut)
{
    RateLimiter limiter(100);

    limiter.addBucket(Const::SOURCE_BUCKET, 0.5);

    limiter.acquire(Const::SOURCE_BUCKET);

    try {
        limiter.acquire(Const::SOURCE_BUCKET);
        FAIL() << "acquire did not time out";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::RATE_LIMIT_TIMEOUT, e.getError());
    }

    EXPECT_GE(limiter.getWaitTime(Const::SOURCE_BUCKET), 100);

    RetryClassifier classifier;
    try {
        limiter.acquire(Const::SOURCE_BUCKET);
    } catch (const PkgMigException& e) {
        EXPECT_TRUE(classifier.classify(e, 0).retryable);
    }
}

TEST(RateLimiter, UnknownBucket)
{
    RateLimiter limiter;

    EXPECT_THROW(limiter.acquire("elsewhere"), PkgMigException);
    EXPECT_EQ(0, limiter.getWaitTime("elsewhere"));
}

TEST(RateLimiter, NegativeRateIsRejected)
{
    RateLimiter limiter;

    EXPECT_THROW(limiter.addBucket(Const::SOURCE_BUCKET, -1), PkgMigException);
}

TEST(RateLimiter, ConcurrentAcquire)
{
    RateLimiter limiter(5000);
    std::vector<std::thread> threads;
    std::atomic<int> acquired(0);
    auto start = std::chrono::steady_clock::now();

    limiter.addBucket(Const::SOURCE_BUCKET, 50);

    for (int i = 0; i < 4; i++)
        threads.push_back(std::thread([&limiter, &acquired]() {
            for (int j = 0; j < 25; j++) {
                limiter.acquire(Const::SOURCE_BUCKET);
                acquired++;
            }
        }));

    for (std::thread& thrd : threads)
        thrd.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    // 50 tokens burst, 50 refilled at 50/s
    EXPECT_EQ(100, acquired.load());
    EXPECT_GE(elapsed, 800);
}

TEST(RateLimiter, CancelledWaitReturnsEarly)
{
    RateLimiter limiter(30000);
    Cancellation cancel;
    long waited = 0;

    limiter.addBucket(Const::TARGET_BUCKET, 0.1);
    limiter.acquire(Const::TARGET_BUCKET);

    auto start = std::chrono::steady_clock::now();

    std::thread waiter([&limiter, &cancel, &waited]() {
        waited = limiter.acquire(Const::TARGET_BUCKET, 1, &cancel);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.cancel();
    limiter.interrupt();
    waiter.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(-1, waited);
    EXPECT_LT(elapsed, 5000);
    EXPECT_GE(limiter.getWaitTime(Const::TARGET_BUCKET), 50);
}

TEST(RateLimiter, AvailableTokenIsGrantedWhenCancelled)
{
    RateLimiter limiter(100);
    Cancellation cancel;

    limiter.addBucket(Const::SOURCE_BUCKET, 1);
    cancel.cancel();

    EXPECT_EQ(0, limiter.acquire(Const::SOURCE_BUCKET, 1, &cancel));
    EXPECT_EQ(-1, limiter.acquire(Const::SOURCE_BUCKET, 1, &cancel));
}
