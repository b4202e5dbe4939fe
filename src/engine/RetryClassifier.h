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

/** @page retry_classifier Retry classification

    A failed attempt is classified by its Error code:

    Error | error class | retryable
    ---|---|---
    REMOTE_NETWORK, REMOTE_THROTTLED, REMOTE_SERVER_ERROR, REMOTE_TIMEOUT, RATE_LIMIT_TIMEOUT, other | TransientRemoteError | yes
    REMOTE_AUTHORIZATION | AuthorizationError | no, halts the run
    INTEGRITY_MISMATCH | IntegrityError | no
    REMOTE_MALFORMED_REQUEST | MalformedRequestError | no
    REMOTE_NOT_FOUND | NotFoundError | no
    CHECKPOINT_CONFLICT | CheckpointConflictError | no
    CHECKPOINT_ERROR | CheckpointStoreError | no, halts the run

    The delay before the next attempt n (starting at 0) is

    @verbatim
    min(base * factor^n, cap) + jitter,  0 <= jitter < base * factor^n * (factor - 1) / 2
    @endverbatim

    and is limited to cap. Below the cap delays are strictly increasing.
 */

class RetryClassifier
{
private:
    long baseMs;
    double factor;
    long capMs;
    int maxRetries;
    std::mutex mtx;
    std::mt19937 rng;
public:
    struct classification_t
    {
        bool retryable;
        bool halts;
        std::chrono::milliseconds delay;
        std::string errorClass;
    };

    RetryClassifier(long baseMs_ = Const::DEFAULT_BACKOFF_BASE_MS,
            double factor_ = Const::DEFAULT_BACKOFF_FACTOR, long capMs_ =
                    Const::DEFAULT_BACKOFF_CAP_MS, int maxRetries_ =
                    Const::DEFAULT_MAX_RETRIES) :
            baseMs(baseMs_), factor(factor_), capMs(capMs_), maxRetries(
                    maxRetries_), rng(std::random_device()())
    {
    }

    classification_t classify(Error error, int attempt);
    classification_t classify(const std::exception& e, int attempt);
    std::chrono::milliseconds delay(int attempt);
    int getMaxRetries()
    {
        return maxRetries;
    }

    static std::string errorClass(Error error);
    static Error errorFrom(const std::exception& e);
};
