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

/** @page worker_pool Worker pool

    The worker pool consists of one or more pool instances. Each
    instance is a ThreadPool with concurrencyLimit threads and a
    dispatcher that takes the next work unit and enqueues its artifacts
    in order. With a single instance work units are processed in
    listing order. With several instances (strategy large) the work
    units are consumed in the order the dispatchers become free.

    The outcome of each artifact is passed to the callback as soon as
    it is available. Dispatching of new artifacts stops if

    - the run is cancelled (pause),
    - an artifact failed with an AuthorizationError,
    - the checkpoint store failed, or
    - systemicFailureThreshold consecutive artifacts exhausted their
      retries without any artifact being committed in between.

    Artifacts already dispatched are finished in all of these cases.
 */

void WorkerPool::halt(std::string reason)

{
    if (halted.exchange(true) == false) {
        haltReason = reason;
        TRACE(Trace::error, reason);
        MSG(PKGMIGE0040E, reason);
    }
}

std::string WorkerPool::getHaltReason()

{
    std::lock_guard<std::mutex> lock(mtx);

    return haltReason;
}

void WorkerPool::report(const TransferOutcome& outcome, callback_t callback)

{
    std::lock_guard<std::mutex> lock(mtx);
    std::stringstream reason;

    switch (outcome.outcome) {
        case TransferOutcome::COMMITTED:
            consecutiveExhausted = 0;
            break;
        case TransferOutcome::FAILED_RETRYABLE:
            consecutiveExhausted++;
            if (systemicFailureThreshold > 0
                    && consecutiveExhausted >= systemicFailureThreshold) {
                reason << consecutiveExhausted
                        << " consecutive artifacts exhausted their retries, last: "
                        << outcome.errorClass << ": " << outcome.errorDetail;
                halt(reason.str());
            }
            break;
        default:
            break;
    }

    if (outcome.halts)
        halt(outcome.errorClass + ": " + outcome.errorDetail);

    if (callback)
        callback(outcome);
}

void WorkerPool::processArtifact(Artifact artifact, callback_t callback)

{
    TransferOutcome outcome;

    try {
        outcome = transfer.execute(artifact);
    } catch (const PkgMigException& e) {
        TRACE(Trace::error, artifact.identity, e.what());
        outcome.identity = artifact.identity;
        outcome.errorClass = RetryClassifier::errorClass(e.getError());
        outcome.errorDetail = e.what();
        if (e.getError() == Error::CHECKPOINT_CONFLICT) {
            outcome.outcome = TransferOutcome::CONFLICT;
        } else {
            outcome.outcome = TransferOutcome::ABORTED;
            outcome.halts = true;
        }
    } catch (const std::exception& e) {
        TRACE(Trace::error, artifact.identity, e.what());
        outcome.identity = artifact.identity;
        outcome.outcome = TransferOutcome::ABORTED;
        outcome.errorClass = RetryClassifier::errorClass(Error::GENERAL_ERROR);
        outcome.errorDetail = e.what();
        outcome.halts = true;
    }

    report(outcome, callback);
}

void WorkerPool::dispatch(int instance, const std::vector<WorkUnit>& units,
        int concurrencyLimit, callback_t callback)

{
    std::stringstream name;
    unsigned long idx;
    unsigned long numArtifacts = 0;

    name << "pool" << instance;

    try {
        ThreadPool<Artifact> pool(
                std::bind(&WorkerPool::processArtifact, this,
                        std::placeholders::_1, callback), concurrencyLimit,
                name.str());

        while ((idx = nextUnit++) < units.size()) {
            const WorkUnit& unit = units[idx];

            TRACE(Trace::normal, instance, unit.batchNum,
                    unit.artifacts.size(), unit.bytes);

            for (const Artifact& artifact : unit.artifacts) {
                if (cancel.isCancelled() || halted)
                    break;
                pool.enqueue(instance, artifact);
                numArtifacts++;
            }

            if (cancel.isCancelled() || halted)
                break;
        }

        if (numArtifacts > 0)
            pool.waitCompletion(instance);

        pool.terminate();
    } catch (const std::exception& e) {
        TRACE(Trace::error, instance, e.what());
        std::lock_guard<std::mutex> lock(mtx);
        halt(e.what());
    }

    TRACE(Trace::normal, instance, numArtifacts);
}

void WorkerPool::run(const std::vector<WorkUnit>& units,
        int concurrencyLimit, callback_t callback)

{
    std::vector<std::thread> dispatchers;

    nextUnit = 0;

    TRACE(Trace::normal, units.size(), concurrencyLimit, poolInstances);

    if (poolInstances == 1) {
        dispatch(0, units, concurrencyLimit, callback);
        return;
    }

    for (int i = 0; i < poolInstances; i++)
        dispatchers.push_back(
                std::thread(&WorkerPool::dispatch, this, i, std::cref(units),
                        concurrencyLimit, callback));

    for (std::thread& dispatcher : dispatchers)
        dispatcher.join();
}
