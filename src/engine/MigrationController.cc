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

/** @page migration_controller Migration controller

    The migration controller drives a run through the following states:

    @dot
    digraph run {
        node [shape=box, fontname="courier", fontsize=11];
        Created -> Listing -> Partitioning -> Running;
        Running -> Paused [label="pause"];
        Running -> Completed;
        Running -> Failed [label="systemic failure"];
        Paused -> Listing [label="resume, no snapshot"];
        Paused -> Partitioning [label="resume"];
    }
    @enddot

    - Listing: the source is listed once and the listing is persisted
      as snapshot of the run.
    - Partitioning: the strategy is selected, transfer records left in
      progress by a crash or a pause are set back to pending and all
      artifacts that are already committed (within this run or within
      the run specified by resumeFromRun and its predecessors) are
      removed. The residual artifacts are split into work units.
    - Running: the work units are processed by the worker pool.

    A resumed run always uses its persisted listing snapshot. Artifacts
    that have been removed from the source in the meantime fail with a
    NotFoundError.

    Each run is processed by its own thread. start() and resume() return
    immediately, wait() blocks until the run is not running anymore.
    pause() returns after all slots have finished.
 */

MigrationController::~MigrationController()

{
    std::map<long, std::shared_ptr<run_context_t>> ctxs;

    {
        std::lock_guard<std::mutex> lock(mtx);
        ctxs = contexts;
    }

    for (auto& ctx : ctxs) {
        ctx.second->cancel.cancel();
        ctx.second->limiter->interrupt();
    }

    for (auto& ctx : ctxs)
        join(ctx.second);
}

std::shared_ptr<MigrationController::run_context_t> MigrationController::getContext(
        long runId)

{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = contexts.find(runId);

    if (it == contexts.end())
        return nullptr;

    return it->second;
}

std::shared_ptr<MigrationController::run_context_t> MigrationController::createContext(
        const MigrationConfig& config)

{
    std::shared_ptr<run_context_t> ctx = std::make_shared<run_context_t>();

    ctx->config = config;
    ctx->limiter = std::unique_ptr<RateLimiter>(
            new RateLimiter(config.acquireTimeoutMs));
    ctx->limiter->addBucket(Const::SOURCE_BUCKET, config.rateLimitSource);
    ctx->limiter->addBucket(Const::TARGET_BUCKET, config.rateLimitTarget);
    ctx->classifier = std::unique_ptr<RetryClassifier>(
            new RetryClassifier(config.backoffBaseMs, config.backoffFactor,
                    config.backoffCapMs, config.maxRetries));
    ctx->active = false;
    ctx->lastProgress = 0;

    return ctx;
}

void MigrationController::launch(long runId,
        std::shared_ptr<run_context_t> ctx, bool fresh)

{
    std::lock_guard<std::mutex> lock(ctx->mtx);

    ctx->active = true;
    ctx->thrd = std::thread(&MigrationController::process, this, runId, ctx,
            fresh);
}

void MigrationController::join(std::shared_ptr<run_context_t> ctx)

{
    std::lock_guard<std::mutex> lock(ctx->mtx);

    if (ctx->thrd.joinable())
        ctx->thrd.join();
}

bool MigrationController::isActive(long runId)

{
    std::shared_ptr<run_context_t> ctx = getContext(runId);

    return ctx != nullptr && ctx->active;
}

bool MigrationController::ownedByOtherProcess(const RunInfo& run)

{
    if (run.pid <= 0 || run.pid == getpid())
        return false;

    return kill(run.pid, 0) == 0 || errno == EPERM;
}

void MigrationController::setState(RunInfo *run, RunInfo::run_state state)

{
    TRACE(Trace::normal, run->runId, RunInfo::stateStr(run->state),
            RunInfo::stateStr(state));

    run->state = state;
    runStatus.set(*run);
    store.updateRun(*run);

    MSG(PKGMIGE0050I, run->runId, RunInfo::stateStr(state));
}

std::vector<Artifact> MigrationController::listSource(
        std::shared_ptr<run_context_t> ctx)

{
    std::vector<Artifact> listing;
    std::vector<Artifact> artifacts;
    std::set<std::string> seen;
    RetryClassifier::classification_t classification;

    for (int attempt = 0;; attempt++) {
        try {
            listing = source.list();
            break;
        } catch (const std::exception& e) {
            classification = ctx->classifier->classify(e, attempt);
            TRACE(Trace::error, attempt, e.what());
            MSG(PKGMIGE0051W, attempt + 1, e.what());
            if (classification.retryable == false
                    || attempt + 1 >= Const::LISTING_RETRY
                    || ctx->cancel.sleep(classification.delay) == false)
                throw;
        }
    }

    for (const Artifact& artifact : listing) {
        if (seen.insert(artifact.identity).second == false) {
            TRACE(Trace::error, artifact.identity);
            MSG(PKGMIGE0052W, artifact.identity);
            continue;
        }
        artifacts.push_back(artifact);
    }

    return artifacts;
}

std::set<std::string> MigrationController::priorCommitted(long priorRunId)

{
    std::set<std::string> committed;
    std::set<long> visited;
    std::set<std::string> identities;
    RunInfo prior;
    long runId = priorRunId;

    while (runId != Const::UNSET && visited.insert(runId).second) {
        identities = store.listCommitted(runId);
        committed.insert(identities.begin(), identities.end());

        if (store.getRun(runId, &prior) == false)
            break;

        runId = prior.priorRunId;
    }

    TRACE(Trace::normal, priorRunId, committed.size());

    return committed;
}

void MigrationController::progress(long runId,
        std::shared_ptr<run_context_t> ctx)

{
    time_t now = time(NULL);
    RunStatus st;

    if (now - ctx->lastProgress < Const::PROGRESS_INTERVAL)
        return;

    ctx->lastProgress = now;

    st.run = runStatus.get(runId);
    unsigned long done = st.run.committed + st.run.failedRetryable
            + st.run.failedFatal + st.run.skipped;
    st.remaining = st.run.total > done ? st.run.total - done : 0;
    st.elapsed = now - st.run.startTime;
    if (st.elapsed > 0)
        st.throughput = (double) st.run.bytes / st.elapsed;

    MSG(PKGMIGE0060I, runId, st.run.committed,
            st.run.failedRetryable + st.run.failedFatal, st.remaining,
            PKGMIG::sizeStr(st.throughput));
}

void MigrationController::report(long runId)

{
    RunStatus st = status(runId);

    MSG(PKGMIGE0061I, runId, RunInfo::stateStr(st.run.state),
            st.run.committed, st.run.failedRetryable, st.run.failedFatal,
            st.run.skipped, st.run.conflicts);
    MSG(PKGMIGE0062I, runId, PKGMIG::sizeStr(st.run.bytes), st.elapsed,
            PKGMIG::sizeStr(st.throughput));

    if (st.run.reason.size() != 0)
        MSG(PKGMIGE0063E, runId, st.run.reason);

    for (const FailureInfo& failure : st.failures)
        MSG(PKGMIGE0064E, runId, failure.identity,
                TransferRecord::stateStr(failure.state), failure.errorClass,
                failure.errorDetail);
}

void MigrationController::process(long runId,
        std::shared_ptr<run_context_t> ctx, bool fresh)

{
    RunInfo run;
    std::vector<Artifact> listing;
    std::vector<Artifact> residual;
    std::vector<WorkUnit> units;
    std::set<std::string> excluded;
    std::map<std::string, TransferRecord> records;
    StrategyParams params;
    unsigned long totalBytes = 0;
    long requeued;
    bool halted = false;
    std::string haltReason;

    pthread_setname_np(pthread_self(), "controller");

    try {
        run = runStatus.get(runId);
        run.pid = getpid();
        run.endTime = 0;
        run.reason = "";

        if (fresh == false) {
            listing = store.getListing(runId);
            if (listing.size() == 0 && run.total == 0)
                fresh = true;
        }

        if (fresh) {
            setState(&run, RunInfo::LISTING);
            listing = listSource(ctx);
            store.saveListing(runId, listing);
            run.total = listing.size();
        }

        for (const Artifact& artifact : listing)
            totalBytes += artifact.size;

        setState(&run, RunInfo::PARTITIONING);

        params = StrategyParams::select(ctx->config, totalBytes);
        run.strategy = params.strategy;

        requeued = store.requeueInProgress(runId);

        if (run.priorRunId != Const::UNSET && !isActive(run.priorRunId)) {
            RunInfo prior;
            if (store.getRun(run.priorRunId, &prior)
                    && !ownedByOtherProcess(prior))
                requeued += store.requeueInProgress(run.priorRunId);
        }

        excluded = priorCommitted(run.priorRunId);
        records = store.listRecords(runId);
        Status::countRecords(records, &run);
        run.skipped = 0;

        for (const Artifact& artifact : listing) {
            if (excluded.count(artifact.identity) != 0) {
                run.skipped++;
                continue;
            }
            auto it = records.find(artifact.identity);
            if (it != records.end()
                    && TransferRecord::isTerminal(it->second.state))
                continue;
            residual.push_back(artifact);
        }

        units = Partitioner(params).partition(residual);

        runStatus.set(run);
        store.updateRun(run);

        MSG(PKGMIGE0053I, runId, Configuration::strategyStr(params.strategy),
                listing.size(), residual.size(), units.size(), requeued);

        if (ctx->cancel.isCancelled() == false) {
            Transfer transfer(runId, store, *ctx->limiter, *ctx->classifier,
                    validator, sink, source, target, ctx->cancel);
            WorkerPool pool(transfer, ctx->cancel, params.poolInstances,
                    ctx->config.systemicFailureThreshold);

            ctx->lastProgress = time(NULL);
            setState(&run, RunInfo::RUNNING);

            pool.run(units, params.concurrencyLimit,
                    [this, runId, ctx](const TransferOutcome& outcome) {
                        runStatus.update(runId, outcome);
                        TRACE(Trace::normal, runId, outcome.identity,
                                TransferOutcome::outcomeStr(outcome.outcome),
                                outcome.attempts);
                        if (outcome.outcome == TransferOutcome::FAILED_RETRYABLE
                                || outcome.outcome == TransferOutcome::FAILED_FATAL)
                            MSG(PKGMIGE0054W, outcome.identity,
                                    outcome.errorClass, outcome.errorDetail);
                        progress(runId, ctx);
                    });

            halted = pool.isHalted();
            haltReason = pool.getHaltReason();
        }

        run = runStatus.get(runId);
        records = store.listRecords(runId);
        Status::countRecords(records, &run);

        if (halted) {
            run.state = RunInfo::FAILED;
            run.reason = haltReason;
        } else if (ctx->cancel.isCancelled()) {
            run.state = RunInfo::PAUSED;
        } else {
            run.state = RunInfo::COMPLETED;
        }
        run.endTime = time(NULL);

        runStatus.set(run);
        store.updateRun(run);
    } catch (const std::exception& e) {
        TRACE(Trace::error, runId, e.what());
        MSG(PKGMIGE0055E, runId, e.what());
        run.runId = runId;
        run.state = RunInfo::FAILED;
        run.reason = e.what();
        run.endTime = time(NULL);
        runStatus.set(run);
        try {
            store.updateRun(run);
        } catch (const std::exception& e2) {
            TRACE(Trace::error, runId, e2.what());
            MSG(PKGMIGE0056E, runId, e2.what());
        }
    }

    MSG(PKGMIGE0050I, runId, RunInfo::stateStr(run.state));

    try {
        report(runId);
    } catch (const std::exception& e) {
        TRACE(Trace::error, runId, e.what());
        MSG(PKGMIGE0056E, runId, e.what());
    }

    ctx->active = false;
}

long MigrationController::start(const MigrationConfig& config)

{
    RunInfo run;
    RunInfo prior;
    std::shared_ptr<run_context_t> ctx = createContext(config);

    if (config.resumeFromRun != Const::UNSET
            && store.getRun(config.resumeFromRun, &prior) == false) {
        MSG(PKGMIGE0057E, config.resumeFromRun);
        THROW(Error::RUN_NOT_EXISTS, config.resumeFromRun);
    }

    run.priorRunId = config.resumeFromRun;
    run.strategy = config.strategyHint;
    run.state = RunInfo::CREATED;
    run.startTime = time(NULL);
    run.pid = getpid();

    store.createRun(&run);
    runStatus.add(run);

    {
        std::lock_guard<std::mutex> lock(mtx);
        contexts[run.runId] = ctx;
    }

    MSG(PKGMIGE0058I, run.runId, run.priorRunId);

    launch(run.runId, ctx, true);

    return run.runId;
}

void MigrationController::pause(long runId)

{
    std::shared_ptr<run_context_t> ctx = getContext(runId);
    RunInfo run;

    if (ctx == nullptr || ctx->active == false) {
        if (ctx != nullptr)
            run = runStatus.get(runId);
        else if (store.getRun(runId, &run) == false) {
            MSG(PKGMIGE0057E, runId);
            THROW(Error::RUN_NOT_EXISTS, runId);
        }
        if (ctx == nullptr && ownedByOtherProcess(run)) {
            MSG(PKGMIGE0059E, runId, run.pid);
            THROW(Error::RUN_NOT_OWNED, runId, run.pid);
        }
        MSG(PKGMIGE0065E, runId, RunInfo::stateStr(run.state));
        THROW(Error::RUN_STATE_ERR, runId, run.state);
    }

    MSG(PKGMIGE0066I, runId);

    ctx->cancel.cancel();
    ctx->limiter->interrupt();
    join(ctx);
}

void MigrationController::resume(long runId)

{
    std::shared_ptr<run_context_t> ctx = getContext(runId);
    MigrationConfig config;
    RunInfo run;

    if (ctx != nullptr) {
        config = ctx->config;
    } else {
        if (store.getRun(runId, &run) == false) {
            MSG(PKGMIGE0057E, runId);
            THROW(Error::RUN_NOT_EXISTS, runId);
        }
        config.strategyHint = run.strategy;
    }

    resume(runId, config);
}

void MigrationController::resume(long runId, const MigrationConfig& config)

{
    std::shared_ptr<run_context_t> ctx = getContext(runId);
    std::shared_ptr<run_context_t> newCtx;
    RunInfo run;

    if (ctx != nullptr) {
        if (ctx->active) {
            MSG(PKGMIGE0065E, runId, RunInfo::stateStr(RunInfo::RUNNING));
            THROW(Error::RUN_STATE_ERR, runId);
        }
        join(ctx);
        run = runStatus.get(runId);
    } else {
        if (store.getRun(runId, &run) == false) {
            MSG(PKGMIGE0057E, runId);
            THROW(Error::RUN_NOT_EXISTS, runId);
        }
        if (ownedByOtherProcess(run)) {
            MSG(PKGMIGE0059E, runId, run.pid);
            THROW(Error::RUN_NOT_OWNED, runId, run.pid);
        }
    }

    if (RunInfo::isTerminal(run.state)) {
        MSG(PKGMIGE0065E, runId, RunInfo::stateStr(run.state));
        THROW(Error::RUN_STATE_ERR, runId, run.state);
    }

    newCtx = createContext(config);
    newCtx->config.resumeFromRun = run.priorRunId;

    run.pid = getpid();
    runStatus.set(run);
    store.updateRun(run);

    {
        std::lock_guard<std::mutex> lock(mtx);
        contexts[runId] = newCtx;
    }

    MSG(PKGMIGE0067I, runId, RunInfo::stateStr(run.state));

    launch(runId, newCtx, false);
}

RunStatus MigrationController::status(long runId)

{
    RunInfo run;

    if (runStatus.contains(runId)) {
        run = runStatus.get(runId);
    } else if (store.getRun(runId, &run) == false) {
        MSG(PKGMIGE0057E, runId);
        THROW(Error::RUN_NOT_EXISTS, runId);
    }

    return Status::summarize(store, run);
}

RunInfo::run_state MigrationController::wait(long runId)

{
    std::shared_ptr<run_context_t> ctx = getContext(runId);
    RunInfo run;

    if (ctx == nullptr) {
        if (store.getRun(runId, &run) == false) {
            MSG(PKGMIGE0057E, runId);
            THROW(Error::RUN_NOT_EXISTS, runId);
        }
        return run.state;
    }

    join(ctx);

    return runStatus.get(runId).state;
}
