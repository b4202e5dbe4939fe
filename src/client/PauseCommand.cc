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

#include "PauseCommand.h"

/** @page pkgmig_pause pkgmig pause
    The pkgmig pause command pauses a run that is processed by another
    pkgmig process. SIGTERM is sent to the process recorded for the
    run. That process stops dispatching, lets the transfers in flight
    finish and records the run as paused.

    <tt>@PKGMIGC0012I</tt>

    Example:

    @verbatim
    [root@visp ~]# pkgmig pause -n 3
    A pause request has been sent to process 20871 processing run 3.
    @endverbatim

    The corresponding class is @ref PauseCommand.
 */

void PauseCommand::printUsage()

{
    INFO(PKGMIGC0012I);
}

void PauseCommand::doCommand(int argc, char **argv)

{
    RunInfo run;

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

    if (run.state == RunInfo::PAUSED || RunInfo::isTerminal(run.state)) {
        MSG(PKGMIGC0031E, runId, RunInfo::stateStr(run.state));
        THROW(Error::RUN_STATE_ERR, runId, run.state);
    }

    if (run.pid <= 0 || kill(run.pid, SIGTERM) == -1) {
        MSG(PKGMIGC0032E, runId, run.pid, errno);
        THROW(Error::RUN_NOT_OWNED, runId, run.pid, errno);
    }

    INFO(PKGMIGC0033I, run.pid, runId);
}
