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

#include "InfoRunsCommand.h"

/** @page pkgmig_info_runs pkgmig info runs
    The pkgmig info runs command lists all runs recorded within the
    checkpoint data base.

    <tt>@PKGMIGC0015I</tt>

    Example:

    @verbatim
    [root@visp ~]# pkgmig info runs
    run      state        strategy prior    started              total      committed  failed     skipped    pid
    1        paused       medium   -1       2026-10-17T08:02:11  1204       512        0          0          20544
    2        completed    medium   1        2026-10-17T08:40:57  1204       692        0          512        20871
    @endverbatim

    The corresponding class is @ref InfoRunsCommand.
 */

void InfoRunsCommand::printUsage()

{
    INFO(PKGMIGC0015I);
}

void InfoRunsCommand::doCommand(int argc, char **argv)

{
    processOptions(argc, argv);
    checkOptions(argc, argv);
    traceParms();

    SQLiteCheckpointStore store(dbFile);

    INFO(PKGMIGC0050I);

    for (RunInfo run : store.listRuns()) {
        if (!RunInfo::isTerminal(run.state))
            Status::countRecords(store.listRecords(run.runId), &run);
        INFO(PKGMIGC0051I, run.runId, RunInfo::stateStr(run.state),
                Configuration::strategyStr(run.strategy), run.priorRunId,
                PKGMIG::timeStr(run.startTime), run.total, run.committed,
                run.failedRetryable + run.failedFatal, run.skipped, run.pid);
    }
}
