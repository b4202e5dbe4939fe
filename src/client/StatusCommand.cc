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
#include "ClientIncludes.h"

#include "StatusCommand.h"

/** @page pkgmig_status pkgmig status
    The pkgmig status command prints the report of a run. The counters
    are evaluated from the transfer records such that the report is
    also up to date for a run that is currently processed by another
    process. For paused and finished runs the failed artifacts are
    listed.

    <tt>@PKGMIGC0013I</tt>

    Example:

    @verbatim
    [root@visp ~]# pkgmig status -n 3
    run:               3
    state:             completed
    strategy:          medium
    prior run:         -1
    started:           2026-10-17T09:12:44
    ended:             2026-10-17T09:31:02
    total:             1204
    committed:         1203
    failed retryable:  0
    failed fatal:      1
    skipped:           0
    conflicts:         0
    remaining:         0
    transferred:       44.2GiB
    elapsed:           1098s
    throughput:        41.2MiB/s
    failures:
       pkgs/a/a-1.0.tgz                  failed_fatal       IntegrityError            1  checksum: expected 9f2c..., actual 11de...
    @endverbatim

    The corresponding class is @ref StatusCommand.
 */

void StatusCommand::printUsage()

{
    INFO(PKGMIGC0013I);
}

void StatusCommand::doCommand(int argc, char **argv)

{
    RunInfo run;
    RunStatus st;

    processOptions(argc, argv);
    checkOptions(argc, argv);
    traceParms();

    if (runId == Const::UNSET) {
        MSG(PKGMIGC0009E);
        printUsage();
        THROW(Error::GENERAL_ERROR);
    }

    SQLiteCheckpointStore store(dbFile);

    if (store.getRun(runId, &run) == false) {
        MSG(PKGMIGC0030E, runId);
        THROW(Error::RUN_NOT_EXISTS, runId);
    }

    Status::countRecords(store.listRecords(runId), &run);
    st = Status::summarize(store, run);

    INFO(PKGMIGC0040I, st.run.runId, RunInfo::stateStr(st.run.state),
            Configuration::strategyStr(st.run.strategy), st.run.priorRunId,
            PKGMIG::timeStr(st.run.startTime), PKGMIG::timeStr(st.run.endTime),
            st.run.total, st.run.committed, st.run.failedRetryable,
            st.run.failedFatal, st.run.skipped, st.run.conflicts, st.remaining,
            PKGMIG::sizeStr(st.run.bytes), st.elapsed,
            PKGMIG::sizeStr((unsigned long) st.throughput));

    if (st.run.reason.size() != 0)
        INFO(PKGMIGC0041I, st.run.reason);

    if (st.failures.size() == 0)
        return;

    INFO(PKGMIGC0042I);
    for (const FailureInfo& failure : st.failures)
        INFO(PKGMIGC0043I, failure.identity,
                TransferRecord::stateStr(failure.state), failure.errorClass,
                failure.attempts, failure.errorDetail);
}
