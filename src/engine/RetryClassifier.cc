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

std::string RetryClassifier::errorClass(Error error)

{
    switch (error) {
        case Error::REMOTE_AUTHORIZATION:
            return "AuthorizationError";
        case Error::INTEGRITY_MISMATCH:
            return "IntegrityError";
        case Error::REMOTE_MALFORMED_REQUEST:
            return "MalformedRequestError";
        case Error::REMOTE_NOT_FOUND:
            return "NotFoundError";
        case Error::CHECKPOINT_CONFLICT:
            return "CheckpointConflictError";
        case Error::CHECKPOINT_ERROR:
            return "CheckpointStoreError";
        default:
            return "TransientRemoteError";
    }
}

Error RetryClassifier::errorFrom(const std::exception& e)

{
    const PkgMigException *pe = dynamic_cast<const PkgMigException*>(&e);

    if (pe == nullptr)
        return Error::GENERAL_ERROR;

    return pe->getError();
}

std::chrono::milliseconds RetryClassifier::delay(int attempt)

{
    double exp = baseMs * std::pow(factor, attempt);
    double jitter = 0;
    double result;

    if (exp >= capMs)
        return std::chrono::milliseconds(capMs);

    if (factor > 1) {
        std::lock_guard<std::mutex> lock(mtx);
        std::uniform_real_distribution<double> dist(0,
                exp * (factor - 1) / 2);
        jitter = dist(rng);
    }

    result = exp + jitter;
    if (result > capMs)
        result = capMs;

    return std::chrono::milliseconds(static_cast<long>(result));
}

RetryClassifier::classification_t RetryClassifier::classify(Error error,
        int attempt)

{
    classification_t classification;

    classification.errorClass = errorClass(error);
    classification.delay = std::chrono::milliseconds(0);
    classification.halts = false;

    switch (error) {
        case Error::REMOTE_AUTHORIZATION:
        case Error::CHECKPOINT_ERROR:
            classification.retryable = false;
            classification.halts = true;
            break;
        case Error::INTEGRITY_MISMATCH:
        case Error::REMOTE_MALFORMED_REQUEST:
        case Error::REMOTE_NOT_FOUND:
        case Error::CHECKPOINT_CONFLICT:
            classification.retryable = false;
            break;
        default:
            classification.retryable = true;
            classification.delay = delay(attempt);
    }

    TRACE(Trace::full, attempt, classification.errorClass,
            classification.retryable, classification.delay.count());

    return classification;
}

RetryClassifier::classification_t RetryClassifier::classify(
        const std::exception& e, int attempt)

{
    return classify(errorFrom(e), attempt);
}
