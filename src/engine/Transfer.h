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

struct TransferOutcome
{
    enum outcome_t
    {
        COMMITTED,        /**@< 0 */
        FAILED_RETRYABLE, /**@< 1 */
        FAILED_FATAL,     /**@< 2 */
        SKIPPED,          /**@< 3 */
        CONFLICT,         /**@< 4 */
        REQUEUED,         /**@< 5 */
        ABORTED           /**@< 6 */
    };

    outcome_t outcome = ABORTED;
    std::string identity;
    TransferRecord::state_t prior = TransferRecord::PENDING;
    int attempts = 0;
    unsigned long bytes = 0;
    std::string errorClass;
    std::string errorDetail;
    bool halts = false;

    static std::string outcomeStr(outcome_t outcome);
};

class Transfer
{
private:
    long runId;
    CheckpointStore& store;
    RateLimiter& limiter;
    RetryClassifier& classifier;
    const Validator& validator;
    ObservabilitySink& sink;
    SourceStore& source;
    TargetStore& target;
    Cancellation& cancel;

    void put(std::string identity, TransferRecord *record,
            TransferRecord::state_t toState,
            TransferRecord::state_t fromState);
    bool transferData(const Artifact& artifact, TransferRecord *record);
    TransferOutcome requeue(const Artifact& artifact, TransferRecord *record,
            TransferOutcome outcome);
    static std::string detailOf(const std::exception& e);
public:
    Transfer(long runId_, CheckpointStore& store_, RateLimiter& limiter_,
            RetryClassifier& classifier_, const Validator& validator_,
            ObservabilitySink& sink_, SourceStore& source_,
            TargetStore& target_, Cancellation& cancel_) :
            runId(runId_), store(store_), limiter(limiter_), classifier(
                    classifier_), validator(validator_), sink(sink_), source(
                    source_), target(target_), cancel(cancel_)
    {
    }

    TransferOutcome execute(const Artifact& artifact);
};
