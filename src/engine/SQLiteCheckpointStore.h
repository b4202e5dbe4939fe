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

class SQLiteCheckpointStore: public CheckpointStore
{
private:
    DataBase db;
    std::recursive_mutex mtx;

    static const std::string CREATE_RUNS;
    static const std::string CREATE_ARTIFACTS;
    static const std::string CREATE_TRANSFER_RECORDS;
    static const std::string CREATE_RECORDS_STATE_INDEX;
    static const std::string TRANSACTION_BEGIN;
    static const std::string TRANSACTION_COMMIT;
    static const std::string TRANSACTION_ROLLBACK;
    static const std::string ADD_RUN;
    static const std::string UPDATE_RUN;
    static const std::string SELECT_RUN;
    static const std::string SELECT_RUNS;
    static const std::string DELETE_LISTING;
    static const std::string ADD_ARTIFACT;
    static const std::string SELECT_LISTING;
    static const std::string SELECT_RECORD;
    static const std::string INSERT_RECORD;
    static const std::string UPDATE_RECORD;
    static const std::string SELECT_IDENTITIES;
    static const std::string SELECT_RECORDS;
    static const std::string REQUEUE_RECORDS;

    void createTables();
    void exec(std::string sql);
public:
    SQLiteCheckpointStore(std::string fileName = Const::DB_FILE,
            bool dbUseMemory = false);

    long createRun(RunInfo *run);
    void updateRun(const RunInfo& run);
    bool getRun(long runId, RunInfo *run);
    std::vector<RunInfo> listRuns();

    void saveListing(long runId, const std::vector<Artifact>& artifacts);
    std::vector<Artifact> getListing(long runId);

    bool getRecord(long runId, std::string identity, TransferRecord *record);
    void putRecord(long runId, std::string identity,
            const TransferRecord& record,
            TransferRecord::state_t expectedPrior);
    std::set<std::string> listCommitted(long runId);
    std::map<std::string, TransferRecord> listRecords(long runId);
    long requeueInProgress(long runId);
};
