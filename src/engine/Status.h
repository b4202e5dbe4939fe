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

struct FailureInfo
{
    std::string identity;
    TransferRecord::state_t state;
    int attempts;
    std::string errorClass;
    std::string errorDetail;
};

struct RunStatus
{
    RunInfo run;
    unsigned long remaining = 0;
    long elapsed = 0;
    double throughput = 0;
    std::vector<FailureInfo> failures;
};

class Status
{
private:
    std::map<long, RunInfo> allRuns;
    std::mutex mtx;

public:
    Status()
    {
    }
    void add(const RunInfo& run);
    bool contains(long runId);
    void update(long runId, const TransferOutcome& outcome);
    void set(const RunInfo& run);
    RunInfo get(long runId);

    static void countRecords(const std::map<std::string, TransferRecord>& records,
            RunInfo *run);
    static RunStatus summarize(CheckpointStore& store, const RunInfo& run);
};
