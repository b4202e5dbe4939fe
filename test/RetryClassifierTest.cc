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

TEST(RetryClassifier, ThrottlingIsRetryableWithIncreasingDelay)
{
    RetryClassifier classifier(100, 2.0, 60000, 5);
    long last = -1;

    for (int attempt = 0; attempt < 8; attempt++) {
        RetryClassifier::classification_t classification = classifier.classify(
                Error::REMOTE_THROTTLED, attempt);
        EXPECT_TRUE(classification.retryable);
        EXPECT_FALSE(classification.halts);
        EXPECT_EQ("TransientRemoteError", classification.errorClass);
        EXPECT_GT(classification.delay.count(), last);
        EXPECT_GE(classification.delay.count(),
                static_cast<long>(100 * std::pow(2.0, attempt)));
        last = classification.delay.count();
    }
}

TEST(RetryClassifier, DelayIsCapped)
{
    RetryClassifier classifier(100, 2.0, 1000, 5);

    for (int attempt = 0; attempt < 20; attempt++)
        EXPECT_LE(classifier.delay(attempt).count(), 1000);

    EXPECT_EQ(1000, classifier.delay(10).count());
}

TEST(RetryClassifier, TransientErrors)
{
    RetryClassifier classifier;

    for (Error error : { Error::REMOTE_NETWORK, Error::REMOTE_SERVER_ERROR,
            Error::REMOTE_TIMEOUT, Error::RATE_LIMIT_TIMEOUT,
            Error::GENERAL_ERROR }) {
        RetryClassifier::classification_t classification = classifier.classify(
                error, 0);
        EXPECT_TRUE(classification.retryable);
        EXPECT_EQ("TransientRemoteError", classification.errorClass);
    }
}

TEST(RetryClassifier, AuthorizationIsFatalRegardlessOfAttempt)
{
    RetryClassifier classifier;

    for (int attempt = 0; attempt < 10; attempt++) {
        RetryClassifier::classification_t classification = classifier.classify(
                Error::REMOTE_AUTHORIZATION, attempt);
        EXPECT_FALSE(classification.retryable);
        EXPECT_TRUE(classification.halts);
        EXPECT_EQ("AuthorizationError", classification.errorClass);
        EXPECT_EQ(0, classification.delay.count());
    }
}

TEST(RetryClassifier, FatalErrors)
{
    RetryClassifier classifier;
    std::map<Error, std::string> fatal = {
            { Error::INTEGRITY_MISMATCH, "IntegrityError" },
            { Error::REMOTE_MALFORMED_REQUEST, "MalformedRequestError" },
            { Error::REMOTE_NOT_FOUND, "NotFoundError" },
            { Error::CHECKPOINT_CONFLICT, "CheckpointConflictError" } };

    for (const auto& entry : fatal) {
        RetryClassifier::classification_t classification = classifier.classify(
                entry.first, 0);
        EXPECT_FALSE(classification.retryable);
        EXPECT_FALSE(classification.halts);
        EXPECT_EQ(entry.second, classification.errorClass);
    }

    EXPECT_TRUE(classifier.classify(Error::CHECKPOINT_ERROR, 0).halts);
}

TEST(RetryClassifier, ClassifiesExceptions)
{
    RetryClassifier classifier;

    try {
        THROW(Error::REMOTE_NOT_FOUND, "pkg/gone.tgz");
    } catch (const std::exception& e) {
        EXPECT_EQ(Error::REMOTE_NOT_FOUND, RetryClassifier::errorFrom(e));
        EXPECT_EQ("NotFoundError", classifier.classify(e, 0).errorClass);
    }

    std::runtime_error unknown("connection reset by peer");
    EXPECT_EQ(Error::GENERAL_ERROR, RetryClassifier::errorFrom(unknown));
    EXPECT_TRUE(classifier.classify(unknown, 0).retryable);
}
