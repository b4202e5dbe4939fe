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

class WorkerPool
{
public:
    typedef std::function<void(const TransferOutcome& outcome)> callback_t;
private:
    Transfer& transfer;
    Cancellation& cancel;
    int poolInstances;
    int systemicFailureThreshold;

    std::mutex mtx;
    std::atomic<bool> halted;
    std::string haltReason;
    int consecutiveExhausted;
    std::atomic<unsigned long> nextUnit;

    void halt(std::string reason);
    void report(const TransferOutcome& outcome, callback_t callback);
    void processArtifact(Artifact artifact, callback_t callback);
    void dispatch(int instance, const std::vector<WorkUnit>& units,
            int concurrencyLimit, callback_t callback);
public:
    WorkerPool(Transfer& transfer_, Cancellation& cancel_,
            int poolInstances_ = 1, int systemicFailureThreshold_ =
                    Const::DEFAULT_SYSTEMIC_FAILURE_THRESHOLD) :
            transfer(transfer_), cancel(cancel_), poolInstances(
                    poolInstances_ > 0 ? poolInstances_ : 1), systemicFailureThreshold(
                    systemicFailureThreshold_), halted(false), consecutiveExhausted(
                    0), nextUnit(0)
    {
    }

    void run(const std::vector<WorkUnit>& units, int concurrencyLimit,
            callback_t callback);
    bool isHalted()
    {
        return halted;
    }
    std::string getHaltReason();
};
