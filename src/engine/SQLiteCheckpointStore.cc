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

SQLiteCheckpointStore::SQLiteCheckpointStore(std::string fileName,
        bool dbUseMemory)

{
    db.open(fileName, dbUseMemory);
    createTables();
}

void SQLiteCheckpointStore::exec(std::string sql)

{
    SQLStatement stmt(db, sql);

    stmt.doall();
}

void SQLiteCheckpointStore::createTables()

{
    std::lock_guard<std::recursive_mutex> lock(mtx);

    exec(CREATE_RUNS);
    exec(CREATE_ARTIFACTS);
    exec(CREATE_TRANSFER_RECORDS);
    exec(CREATE_RECORDS_STATE_INDEX);
}

long SQLiteCheckpointStore::createRun(RunInfo *run)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);

    stmt(ADD_RUN) << run->priorRunId << run->strategy << run->state
            << run->startTime << run->endTime << run->total << run->pid
            << run->committed << run->failedRetryable << run->failedFatal
            << run->skipped << run->conflicts << run->bytes << run->reason;

    TRACE(Trace::full, stmt.str());

    stmt.doall();

    run->runId = db.lastInsertId();

    TRACE(Trace::normal, run->runId);

    return run->runId;
}

void SQLiteCheckpointStore::updateRun(const RunInfo& run)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);

    stmt(UPDATE_RUN) << run.priorRunId << run.strategy << run.state
            << run.startTime << run.endTime << run.total << run.pid
            << run.committed << run.failedRetryable << run.failedFatal
            << run.skipped << run.conflicts << run.bytes << run.reason
            << run.runId;

    TRACE(Trace::full, stmt.str());

    stmt.doall();

    if (db.lastUpdates() == 0) {
        MSG(PKGMIGE0003E, run.runId);
        THROW(Error::RUN_NOT_EXISTS, run.runId);
    }
}

bool SQLiteCheckpointStore::getRun(long runId, RunInfo *run)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    bool found;

    stmt(SELECT_RUN) << runId;
    stmt.prepare();
    found = stmt.step(&run->runId, &run->priorRunId, &run->strategy,
            &run->state, &run->startTime, &run->endTime, &run->total,
            &run->pid, &run->committed, &run->failedRetryable,
            &run->failedFatal, &run->skipped, &run->conflicts, &run->bytes,
            &run->reason);
    stmt.finalize();

    return found;
}

std::vector<RunInfo> SQLiteCheckpointStore::listRuns()

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    std::vector<RunInfo> runs;
    RunInfo run;

    stmt(SELECT_RUNS);
    stmt.prepare();
    while (stmt.step(&run.runId, &run.priorRunId, &run.strategy, &run.state,
            &run.startTime, &run.endTime, &run.total, &run.pid,
            &run.committed, &run.failedRetryable, &run.failedFatal,
            &run.skipped, &run.conflicts, &run.bytes, &run.reason))
        runs.push_back(run);
    stmt.finalize();

    return runs;
}

void SQLiteCheckpointStore::saveListing(long runId,
        const std::vector<Artifact>& artifacts)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    int seq = 0;

    exec(TRANSACTION_BEGIN);

    try {
        SQLStatement stmt(db);

        stmt(DELETE_LISTING) << runId;
        stmt.doall();

        stmt(ADD_ARTIFACT) << runId;
        stmt.prepare();
        for (const Artifact& artifact : artifacts) {
            stmt.bind(1, seq++);
            stmt.bind(2, artifact.identity);
            stmt.bind(3, static_cast<long>(artifact.size));
            stmt.bind(4, artifact.checksum);
            stmt.bind(5, artifact.contentType);
            stmt.step();
            stmt.reset();
        }
        stmt.finalize();

        exec(TRANSACTION_COMMIT);
    } catch (const std::exception& e) {
        TRACE(Trace::error, runId, seq, e.what());
        MSG(PKGMIGE0004E, runId);
        exec(TRANSACTION_ROLLBACK);
        throw;
    }

    TRACE(Trace::normal, runId, artifacts.size());
}

std::vector<Artifact> SQLiteCheckpointStore::getListing(long runId)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    std::vector<Artifact> artifacts;
    Artifact artifact;

    stmt(SELECT_LISTING) << runId;
    stmt.prepare();
    while (stmt.step(&artifact.identity, &artifact.size, &artifact.checksum,
            &artifact.contentType))
        artifacts.push_back(artifact);
    stmt.finalize();

    return artifacts;
}

bool SQLiteCheckpointStore::getRecord(long runId, std::string identity,
        TransferRecord *record)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    bool found;

    stmt(SELECT_RECORD) << runId << identity;
    stmt.prepare();
    found = stmt.step(&record->state, &record->lastAttempt, &record->attempts,
            &record->errorClass, &record->errorDetail, &record->checksum,
            &record->bytes);
    stmt.finalize();

    return found;
}

void SQLiteCheckpointStore::putRecord(long runId, std::string identity,
        const TransferRecord& record, TransferRecord::state_t expectedPrior)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);

    // a missing record counts as pending
    if (expectedPrior == TransferRecord::PENDING) {
        stmt(INSERT_RECORD) << runId << identity << record.state
                << record.lastAttempt << record.attempts << record.errorClass
                << record.errorDetail << record.checksum << record.bytes;
        stmt.doall();
        if (db.lastUpdates() == 1)
            return;
    }

    stmt(UPDATE_RECORD) << record.state << record.lastAttempt
            << record.attempts << record.errorClass << record.errorDetail
            << record.checksum << record.bytes << runId << identity
            << expectedPrior;
    stmt.doall();

    if (db.lastUpdates() == 0) {
        TRACE(Trace::normal, runId, identity, record.state, expectedPrior);
        THROW(Error::CHECKPOINT_CONFLICT, runId, identity);
    }
}

std::set<std::string> SQLiteCheckpointStore::listCommitted(long runId)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    std::set<std::string> identities;
    std::string identity;

    stmt(SELECT_IDENTITIES) << runId << TransferRecord::COMMITTED;
    stmt.prepare();
    while (stmt.step(&identity))
        identities.insert(identity);
    stmt.finalize();

    return identities;
}

std::map<std::string, TransferRecord> SQLiteCheckpointStore::listRecords(
        long runId)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    std::map<std::string, TransferRecord> records;
    std::string identity;
    TransferRecord record;

    stmt(SELECT_RECORDS) << runId;
    stmt.prepare();
    while (stmt.step(&identity, &record.state, &record.lastAttempt,
            &record.attempts, &record.errorClass, &record.errorDetail,
            &record.checksum, &record.bytes))
        records[identity] = record;
    stmt.finalize();

    return records;
}

long SQLiteCheckpointStore::requeueInProgress(long runId)

{
    std::lock_guard<std::recursive_mutex> lock(mtx);
    SQLStatement stmt(db);
    long num;

    stmt(REQUEUE_RECORDS) << TransferRecord::PENDING << runId
            << TransferRecord::IN_PROGRESS << TransferRecord::VALIDATED;
    stmt.doall();

    num = db.lastUpdates();

    TRACE(Trace::normal, runId, num);

    return num;
}
