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

void Status::add(const RunInfo& run)

{
    std::lock_guard<std::mutex> lock(mtx);

    allRuns[run.runId] = run;
}

bool Status::contains(long runId)

{
    std::lock_guard<std::mutex> lock(mtx);

    return allRuns.count(runId) != 0;
}

void Status::update(long runId, const TransferOutcome& outcome)

{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = allRuns.find(runId);

    if (it == allRuns.end()) {
        TRACE(Trace::error, runId, outcome.identity);
        return;
    }

    RunInfo& run = it->second;

    switch (outcome.outcome) {
        case TransferOutcome::COMMITTED:
        case TransferOutcome::FAILED_RETRYABLE:
        case TransferOutcome::FAILED_FATAL:
            // a re-attempted artifact leaves the retryable failures
            if (outcome.prior == TransferRecord::FAILED_RETRYABLE
                    && run.failedRetryable > 0)
                run.failedRetryable--;
            break;
        default:
            break;
    }

    switch (outcome.outcome) {
        case TransferOutcome::COMMITTED:
            run.committed++;
            run.bytes += outcome.bytes;
            break;
        case TransferOutcome::FAILED_RETRYABLE:
            run.failedRetryable++;
            break;
        case TransferOutcome::FAILED_FATAL:
            run.failedFatal++;
            break;
        case TransferOutcome::SKIPPED:
            run.skipped++;
            break;
        case TransferOutcome::CONFLICT:
            run.conflicts++;
            break;
        default:
            break;
    }
}

void Status::set(const RunInfo& run)

{
    std::lock_guard<std::mutex> lock(mtx);

    allRuns[run.runId] = run;
}

RunInfo Status::get(long runId)

{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = allRuns.find(runId);

    if (it == allRuns.end())
        THROW(Error::RUN_NOT_EXISTS, runId);

    return it->second;
}

void Status::countRecords(
        const std::map<std::string, TransferRecord>& records, RunInfo *run)

{
    run->committed = 0;
    run->failedRetryable = 0;
    run->failedFatal = 0;
    run->bytes = 0;

    for (const auto& record : records) {
        switch (record.second.state) {
            case TransferRecord::COMMITTED:
                run->committed++;
                run->bytes += record.second.bytes;
                break;
            case TransferRecord::FAILED_RETRYABLE:
                run->failedRetryable++;
                break;
            case TransferRecord::FAILED_FATAL:
                run->failedFatal++;
                break;
            default:
                break;
        }
    }
}

RunStatus Status::summarize(CheckpointStore& store, const RunInfo& run)

{
    RunStatus st;
    time_t end;

    st.run = run;

    unsigned long done = st.run.committed + st.run.failedRetryable
            + st.run.failedFatal + st.run.skipped;
    st.remaining = st.run.total > done ? st.run.total - done : 0;

    end = st.run.endTime != 0 ? st.run.endTime : time(NULL);
    st.elapsed = end - st.run.startTime;
    if (st.elapsed > 0)
        st.throughput = (double) st.run.bytes / st.elapsed;

    if (st.run.state == RunInfo::PAUSED || RunInfo::isTerminal(st.run.state)) {
        for (const auto& record : store.listRecords(st.run.runId)) {
            if (record.second.state != TransferRecord::FAILED_RETRYABLE
                    && record.second.state != TransferRecord::FAILED_FATAL)
                continue;
            st.failures.push_back(
                    { record.first, record.second.state,
                            record.second.attempts, record.second.errorClass,
                            record.second.errorDetail });
        }
    }

    return st;
}
