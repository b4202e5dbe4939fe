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

class MigrationController
{
private:
    struct run_context_t
    {
        MigrationConfig config;
        Cancellation cancel;
        std::unique_ptr<RateLimiter> limiter;
        std::unique_ptr<RetryClassifier> classifier;
        std::mutex mtx;
        std::thread thrd;
        std::atomic<bool> active;
        time_t lastProgress;
    };

    CheckpointStore& store;
    SourceStore& source;
    TargetStore& target;
    ObservabilitySink& sink;
    Validator validator;
    Status runStatus;

    std::mutex mtx;
    std::map<long, std::shared_ptr<run_context_t>> contexts;

    std::shared_ptr<run_context_t> getContext(long runId);
    std::shared_ptr<run_context_t> createContext(const MigrationConfig& config);
    void launch(long runId, std::shared_ptr<run_context_t> ctx, bool fresh);
    void join(std::shared_ptr<run_context_t> ctx);
    bool ownedByOtherProcess(const RunInfo& run);

    void setState(RunInfo *run, RunInfo::run_state state);
    std::vector<Artifact> listSource(std::shared_ptr<run_context_t> ctx);
    std::set<std::string> priorCommitted(long priorRunId);
    void process(long runId, std::shared_ptr<run_context_t> ctx, bool fresh);
    void progress(long runId, std::shared_ptr<run_context_t> ctx);
    void report(long runId);
public:
    MigrationController(CheckpointStore& store_, SourceStore& source_,
            TargetStore& target_, ObservabilitySink& sink_) :
            store(store_), source(source_), target(target_), sink(sink_)
    {
    }
    ~MigrationController();

    long start(const MigrationConfig& config);
    void pause(long runId);
    void resume(long runId);
    void resume(long runId, const MigrationConfig& config);
    RunStatus status(long runId);
    RunInfo::run_state wait(long runId);
    bool isActive(long runId);
};
