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

#include "ResumeCommand.h"

/** @page pkgmig_resume pkgmig resume
    The pkgmig resume command continues a paused run or a run whose
    process has been terminated. Artifacts that have been in progress
    are processed again, committed artifacts are not transferred a
    second time. The listing of the run is not repeated.

    <tt>@PKGMIGC0011I</tt>

    If no strategy is specified the strategy of the original start is
    used.

    The corresponding class is @ref ResumeCommand.
 */

void ResumeCommand::printUsage()

{
    INFO(PKGMIGC0011I);
}

void ResumeCommand::doCommand(int argc, char **argv)

{
    MigrationConfig config;
    RunInfo run;

    processOptions(argc, argv);
    checkOptions(argc, argv);
    traceParms();

    if (runId == Const::UNSET) {
        MSG(PKGMIGC0009E);
        printUsage();
        THROW(Error::GENERAL_ERROR);
    }

    checkStores();

    config = getConfig();

    SQLiteCheckpointStore store(dbFile);
    FsSourceStore source(sourceDir);
    FsTargetStore target(targetDir);
    TraceSink sink;
    MigrationController controller(store, source, target, sink);

    if (store.getRun(runId, &run) == false) {
        MSG(PKGMIGC0030E, runId);
        THROW(Error::RUN_NOT_EXISTS, runId);
    }

    if (strategy.size() == 0)
        config.strategyHint = run.strategy;

    controller.resume(runId, config);

    runForeground(&controller, runId);
}
