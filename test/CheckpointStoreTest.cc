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
#include <stdlib.h>

#include <gtest/gtest.h>

#include "src/engine/EngineIncludes.h"

static std::vector<Artifact> makeListing(int num)

{
    std::vector<Artifact> listing;

    for (int i = 0; i < num; i++) {
        Artifact artifact;
        artifact.identity = "pkg/artifact-" + std::to_string(i) + ".tgz";
        artifact.size = 100 * (i + 1);
        artifact.checksum = Validator::digest(artifact.identity);
        artifact.contentType = "application/gzip";
        listing.push_back(artifact);
    }

    return listing;
}

static long createRun(CheckpointStore& store)

{
    RunInfo run;

    run.state = RunInfo::CREATED;
    run.startTime = time(NULL);
    run.pid = getpid();

    return store.createRun(&run);
}

TEST(CheckpointStore, CreateUpdateAndListRuns)
{
    SQLiteCheckpointStore store("", true);
    RunInfo run;
    RunInfo stored;

    run.strategy = strategy_t::MEDIUM;
    run.startTime = 1700000000;
    run.pid = 4711;

    long first = store.createRun(&run);
    EXPECT_EQ(first, run.runId);

    run.state = RunInfo::PAUSED;
    run.committed = 17;
    run.reason = "target isn't reachable";
    store.updateRun(run);

    ASSERT_TRUE(store.getRun(first, &stored));
    EXPECT_EQ(RunInfo::PAUSED, stored.state);
    EXPECT_EQ(strategy_t::MEDIUM, stored.strategy);
    EXPECT_EQ(17UL, stored.committed);
    EXPECT_EQ(4711, stored.pid);
    EXPECT_EQ(Const::UNSET, stored.priorRunId);
    EXPECT_EQ("target isn't reachable", stored.reason);

    RunInfo next;
    next.priorRunId = first;
    long second = store.createRun(&next);
    EXPECT_GT(second, first);

    std::vector<RunInfo> runs = store.listRuns();
    ASSERT_EQ(2U, runs.size());
    EXPECT_EQ(first, runs[0].runId);
    EXPECT_EQ(first, runs[1].priorRunId);

    EXPECT_FALSE(store.getRun(second + 1, &stored));
}

TEST(CheckpointStore, UpdateOfUnknownRunFails)
{
    SQLiteCheckpointStore store("", true);
    RunInfo run;

    run.runId = 42;

    try {
        store.updateRun(run);
        FAIL() << "update of an unknown run succeeded";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::RUN_NOT_EXISTS, e.getError());
    }
}

TEST(CheckpointStore, ListingKeepsOrder)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);
    std::vector<Artifact> listing = makeListing(5);

    listing[2].identity = "pkg/o'brien-1.0.tgz";

    store.saveListing(runId, listing);

    std::vector<Artifact> stored = store.getListing(runId);
    ASSERT_EQ(listing.size(), stored.size());
    for (unsigned int i = 0; i < listing.size(); i++) {
        EXPECT_EQ(listing[i].identity, stored[i].identity);
        EXPECT_EQ(listing[i].size, stored[i].size);
        EXPECT_EQ(listing[i].checksum, stored[i].checksum);
        EXPECT_EQ(listing[i].contentType, stored[i].contentType);
    }

    // saving again replaces the snapshot
    store.saveListing(runId, makeListing(2));
    EXPECT_EQ(2U, store.getListing(runId).size());

    EXPECT_EQ(0U, store.getListing(runId + 1).size());
}

TEST(CheckpointStore, ListingOfManyArtifacts)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);

    ASSERT_NO_THROW(store.saveListing(runId, makeListing(50)));
    EXPECT_EQ(50U, store.getListing(runId).size());

    RunInfo run;
    ASSERT_TRUE(store.getRun(runId, &run));
    EXPECT_EQ(RunInfo::CREATED, run.state);
}

TEST(CheckpointStore, EmptyListing)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);

    store.saveListing(runId, makeListing(3));
    ASSERT_NO_THROW(store.saveListing(runId, std::vector<Artifact>()));
    EXPECT_EQ(0U, store.getListing(runId).size());
}

TEST(CheckpointStore, ConditionalWrite)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);
    TransferRecord record;
    TransferRecord stored;

    EXPECT_FALSE(store.getRecord(runId, "a.tgz", &stored));

    // a missing record counts as pending
    record.state = TransferRecord::IN_PROGRESS;
    record.attempts = 1;
    store.putRecord(runId, "a.tgz", record, TransferRecord::PENDING);

    ASSERT_TRUE(store.getRecord(runId, "a.tgz", &stored));
    EXPECT_EQ(TransferRecord::IN_PROGRESS, stored.state);
    EXPECT_EQ(1, stored.attempts);

    // the prior state does not match
    record.state = TransferRecord::IN_PROGRESS;
    try {
        store.putRecord(runId, "a.tgz", record, TransferRecord::PENDING);
        FAIL() << "second pending -> in_progress transition succeeded";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::CHECKPOINT_CONFLICT, e.getError());
    }

    record.state = TransferRecord::VALIDATED;
    record.checksum = Validator::digest("a");
    record.bytes = 1;
    store.putRecord(runId, "a.tgz", record, TransferRecord::IN_PROGRESS);
    record.state = TransferRecord::COMMITTED;
    store.putRecord(runId, "a.tgz", record, TransferRecord::VALIDATED);

    ASSERT_TRUE(store.getRecord(runId, "a.tgz", &stored));
    EXPECT_EQ(TransferRecord::COMMITTED, stored.state);
    EXPECT_EQ(record.checksum, stored.checksum);
    EXPECT_EQ(1UL, stored.bytes);

    EXPECT_THROW(
            store.putRecord(runId, "a.tgz", record, TransferRecord::IN_PROGRESS),
            PkgMigException);

    // records are kept per run
    EXPECT_FALSE(store.getRecord(runId + 1, "a.tgz", &stored));
}

TEST(CheckpointStore, ErrorDetailIsEncoded)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);
    TransferRecord record;
    TransferRecord stored;

    record.state = TransferRecord::FAILED_FATAL;
    record.errorClass = "IntegrityError";
    record.errorDetail = "source: checksum: expected 'abc', actual 'def'";
    store.putRecord(runId, "b.tgz", record, TransferRecord::PENDING);

    ASSERT_TRUE(store.getRecord(runId, "b.tgz", &stored));
    EXPECT_EQ(record.errorDetail, stored.errorDetail);
    EXPECT_EQ("IntegrityError", stored.errorClass);
}

TEST(CheckpointStore, OnlyOneWriterWinsTheRace)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);
    std::atomic<int> winners(0);
    std::atomic<int> conflicts(0);
    std::vector<std::thread> writers;

    for (int i = 0; i < 16; i++) {
        writers.push_back(std::thread([&store, runId, &winners, &conflicts]() {
            TransferRecord record;
            record.state = TransferRecord::IN_PROGRESS;
            record.attempts = 1;
            try {
                store.putRecord(runId, "contended.tgz", record,
                        TransferRecord::PENDING);
                winners++;
            } catch (const PkgMigException& e) {
                if (e.getError() == Error::CHECKPOINT_CONFLICT)
                    conflicts++;
            }
        }));
    }

    for (std::thread& writer : writers)
        writer.join();

    EXPECT_EQ(1, winners);
    EXPECT_EQ(15, conflicts);
}

TEST(CheckpointStore, OnlyOneProcessWinsTheRace)
{
    char tmpl[] = "/tmp/pkgmig_db_XXXXXX";
    ASSERT_NE(nullptr, mkdtemp(tmpl));
    std::string fileName = std::string(tmpl) + "/checkpoint.db";
    int winners = 0;
    int conflicts = 0;

    {
        SQLiteCheckpointStore first(fileName);
        SQLiteCheckpointStore second(fileName);
        long runId = createRun(first);
        TransferRecord record;

        record.state = TransferRecord::IN_PROGRESS;

        for (SQLiteCheckpointStore *store : { &first, &second }) {
            try {
                store->putRecord(runId, "shared.tgz", record,
                        TransferRecord::PENDING);
                winners++;
            } catch (const PkgMigException& e) {
                EXPECT_EQ(Error::CHECKPOINT_CONFLICT, e.getError());
                conflicts++;
            }
        }

        TransferRecord stored;
        ASSERT_TRUE(second.getRecord(runId, "shared.tgz", &stored));
        EXPECT_EQ(TransferRecord::IN_PROGRESS, stored.state);
    }

    EXPECT_EQ(1, winners);
    EXPECT_EQ(1, conflicts);

    unlink(fileName.c_str());
    rmdir(tmpl);
}

TEST(CheckpointStore, RequeueInProgress)
{
    SQLiteCheckpointStore store("", true);
    long runId = createRun(store);
    TransferRecord record;

    record.state = TransferRecord::COMMITTED;
    store.putRecord(runId, "committed.tgz", record, TransferRecord::PENDING);
    record.state = TransferRecord::IN_PROGRESS;
    store.putRecord(runId, "inflight.tgz", record, TransferRecord::PENDING);
    record.state = TransferRecord::VALIDATED;
    store.putRecord(runId, "validated.tgz", record, TransferRecord::PENDING);
    record.state = TransferRecord::FAILED_RETRYABLE;
    store.putRecord(runId, "retryable.tgz", record, TransferRecord::PENDING);

    EXPECT_EQ(2, store.requeueInProgress(runId));

    std::map<std::string, TransferRecord> records = store.listRecords(runId);
    ASSERT_EQ(4U, records.size());
    EXPECT_EQ(TransferRecord::COMMITTED, records["committed.tgz"].state);
    EXPECT_EQ(TransferRecord::PENDING, records["inflight.tgz"].state);
    EXPECT_EQ(TransferRecord::PENDING, records["validated.tgz"].state);
    EXPECT_EQ(TransferRecord::FAILED_RETRYABLE, records["retryable.tgz"].state);

    std::set<std::string> committed = store.listCommitted(runId);
    ASSERT_EQ(1U, committed.size());
    EXPECT_EQ(1U, committed.count("committed.tgz"));

    EXPECT_EQ(0, store.requeueInProgress(runId));
}
