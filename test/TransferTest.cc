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
#include "FakeStores.h"

class TransferTest: public ::testing::Test
{
protected:
    SQLiteCheckpointStore checkpoints;
    RendezvousStore store;
    FakeSourceStore source;
    FakeTargetStore target;
    TraceSink sink;
    RateLimiter limiter;
    RetryClassifier classifier;
    Validator validator;
    Cancellation cancel;
    long runId;

    TransferTest() :
            checkpoints("", true), store(checkpoints, 2), runId(0)
    {
    }

    void SetUp()
    {
        RunInfo run;

        run.state = RunInfo::RUNNING;
        run.startTime = time(NULL);
        run.pid = getpid();
        runId = checkpoints.createRun(&run);

        limiter.addBucket(Const::SOURCE_BUCKET, 0);
        limiter.addBucket(Const::TARGET_BUCKET, 0);

        source.add("pkg/shared-1.0.tgz", "shared content");
        target.setDelay(std::chrono::milliseconds(20));
    }

    Artifact artifact()
    {
        return source.list()[0];
    }
};

TEST_F(TransferTest, TwoSlotsRaceForOneArtifact)
{
    Transfer transfer(runId, store, limiter, classifier, validator, sink,
            source, target, cancel);
    Artifact shared = artifact();
    TransferOutcome outcomes[2];
    TransferRecord record;
    int committed = 0;
    int conflicts = 0;

    std::thread first([&transfer, &shared, &outcomes]() {
        outcomes[0] = transfer.execute(shared);
    });
    std::thread second([&transfer, &shared, &outcomes]() {
        outcomes[1] = transfer.execute(shared);
    });

    first.join();
    second.join();

    for (const TransferOutcome& outcome : outcomes) {
        if (outcome.outcome == TransferOutcome::COMMITTED)
            committed++;
        else if (outcome.outcome == TransferOutcome::CONFLICT)
            conflicts++;
    }

    EXPECT_EQ(1, committed);
    EXPECT_EQ(1, conflicts);
    EXPECT_EQ(1, target.getWrites(shared.identity));
    EXPECT_EQ(1, source.getReads(shared.identity));
    EXPECT_EQ(1, sink.getCounter("conflicts"));
    EXPECT_EQ(1, sink.getCounter("successes"));

    ASSERT_TRUE(checkpoints.getRecord(runId, shared.identity, &record));
    EXPECT_EQ(TransferRecord::COMMITTED, record.state);
    EXPECT_EQ(1, record.attempts);
}

TEST_F(TransferTest, DuplicateDispatchAcrossPoolInstances)
{
    Transfer transfer(runId, store, limiter, classifier, validator, sink,
            source, target, cancel);
    WorkerPool pool(transfer, cancel, 2, 0);
    std::vector<WorkUnit> units(2);
    std::vector<TransferOutcome> outcomes;
    std::mutex mtx;
    int committed = 0;
    int conflicts = 0;

    for (int i = 0; i < 2; i++) {
        units[i].batchNum = i;
        units[i].artifacts.push_back(artifact());
        units[i].bytes = units[i].artifacts[0].size;
    }

    // two slots per instance in case one dispatcher takes both units
    pool.run(units, 2, [&mtx, &outcomes](const TransferOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mtx);
        outcomes.push_back(outcome);
    });

    EXPECT_FALSE(pool.isHalted());
    ASSERT_EQ(2u, outcomes.size());

    for (const TransferOutcome& outcome : outcomes) {
        if (outcome.outcome == TransferOutcome::COMMITTED)
            committed++;
        else if (outcome.outcome == TransferOutcome::CONFLICT)
            conflicts++;
    }

    EXPECT_EQ(1, committed);
    EXPECT_EQ(1, conflicts);
    EXPECT_EQ(1, target.getWrites("pkg/shared-1.0.tgz"));
    EXPECT_EQ(1, sink.getCounter("conflicts"));
}

TEST_F(TransferTest, PauseDuringTokenWaitRequeues)
{
    RateLimiter slow(30000);
    Transfer transfer(runId, checkpoints, slow, classifier, validator, sink,
            source, target, cancel);
    TransferOutcome outcome;
    TransferRecord record;

    slow.addBucket(Const::SOURCE_BUCKET, 0);
    slow.addBucket(Const::TARGET_BUCKET, 0.1);
    slow.acquire(Const::TARGET_BUCKET);

    auto start = std::chrono::steady_clock::now();

    std::thread slot([&transfer, &outcome, this]() {
        outcome = transfer.execute(artifact());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.cancel();
    slow.interrupt();
    slot.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    EXPECT_LT(elapsed, 5000);
    EXPECT_EQ(TransferOutcome::REQUEUED, outcome.outcome);
    EXPECT_EQ(0, target.getWrites("pkg/shared-1.0.tgz"));

    ASSERT_TRUE(checkpoints.getRecord(runId, "pkg/shared-1.0.tgz", &record));
    EXPECT_EQ(TransferRecord::PENDING, record.state);
}
