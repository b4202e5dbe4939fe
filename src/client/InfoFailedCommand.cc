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

#include "InfoFailedCommand.h"

/** @page pkgmig_info_failed pkgmig info failed
    The pkgmig info failed command lists the artifacts of a run that
    failed together with the error class and the error detail of the
    last attempt. The list can be used to remediate the failures
    before the run is resumed or a new run is started with -r.

    <tt>@PKGMIGC0016I</tt>

    The corresponding class is @ref InfoFailedCommand.
 */

void InfoFailedCommand::printUsage()

{
    INFO(PKGMIGC0016I);
}

void InfoFailedCommand::doCommand(int argc, char **argv)

{
    RunInfo run;
    int count = 0;

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

    for (const auto& record : store.listRecords(runId)) {
        if (record.second.state != TransferRecord::FAILED_RETRYABLE
                && record.second.state != TransferRecord::FAILED_FATAL)
            continue;
        if (count++ == 0)
            INFO(PKGMIGC0042I);
        INFO(PKGMIGC0043I, record.first,
                TransferRecord::stateStr(record.second.state),
                record.second.errorClass, record.second.attempts,
                record.second.errorDetail);
    }

    if (count == 0)
        INFO(PKGMIGC0044I, runId);
}
