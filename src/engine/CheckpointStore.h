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

/** @page checkpoint_store Checkpoint store

    The checkpoint store is the single durable source of truth for runs
    and transfer records. The only mutual exclusion primitive required
    by the migration engine is the conditional write putRecord(): a
    record is written only if its current state equals the expected
    prior state. A missing record is regarded to be in state pending.
    If the condition does not hold an exception with the error code
    Error::CHECKPOINT_CONFLICT is thrown.

    Any other failure of the store is reported with the error code
    Error::CHECKPOINT_ERROR.
 */

class CheckpointStore
{
public:
    virtual ~CheckpointStore()
    {
    }

    virtual long createRun(RunInfo *run) = 0;
    virtual void updateRun(const RunInfo& run) = 0;
    virtual bool getRun(long runId, RunInfo *run) = 0;
    virtual std::vector<RunInfo> listRuns() = 0;

    virtual void saveListing(long runId,
            const std::vector<Artifact>& artifacts) = 0;
    virtual std::vector<Artifact> getListing(long runId) = 0;

    virtual bool getRecord(long runId, std::string identity,
            TransferRecord *record) = 0;
    virtual void putRecord(long runId, std::string identity,
            const TransferRecord& record,
            TransferRecord::state_t expectedPrior) = 0;
    virtual std::set<std::string> listCommitted(long runId) = 0;
    virtual std::map<std::string, TransferRecord> listRecords(long runId) = 0;
    virtual long requeueInProgress(long runId) = 0;
};
