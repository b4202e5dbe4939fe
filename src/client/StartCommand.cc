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

#include "StartCommand.h"

/** @page pkgmig_start pkgmig start
    The pkgmig start command starts a new migration run between two
    directory trees. The run is processed in the foreground. Sending
    SIGINT or SIGTERM to the process pauses the run.

    <tt>@PKGMIGC0010I</tt>

    parameters | description
    ---|---
    -s \<directory\> | the root directory of the source store
    -t \<directory\> | the root directory of the target store
    -c \<file name\> | the configuration file
    -S \<strategy\> | small, medium, large or auto
    -r \<run id\> | skip the artifacts already committed by this run
    -b \<count\> | the maximum number of artifacts per work unit
    -m \<count\> | the maximum number of retries
    -o \<key=value\> | set a configuration option
    -d \<file name\> | the checkpoint data base

    Example:

    @verbatim
    [root@visp ~]# pkgmig start -s /mnt/repo-old -t /mnt/repo-new -S medium
    PKGMIGE0058I(0412): Run 3 has been started (prior run: -1).
    PKGMIGE0050I(0133): Run 3: state changed to listing.
    PKGMIGE0050I(0133): Run 3: state changed to partitioning.
    PKGMIGE0053I(0301): Run 3: strategy medium, 1204 artifacts listed, 1204 to transfer in 13 work units, 0 requeued.
    PKGMIGE0050I(0133): Run 3: state changed to running.
    PKGMIGE0060I(0219): Run 3: 512 committed, 0 failed, 692 remaining, 41.7MiB/s.
    ...
    @endverbatim

    The corresponding class is @ref StartCommand.
 */

void StartCommand::printUsage()

{
    INFO(PKGMIGC0010I);
}

void StartCommand::doCommand(int argc, char **argv)

{
    MigrationConfig config;
    long id;

    processOptions(argc, argv);
    checkOptions(argc, argv);
    traceParms();
    checkStores();

    config = getConfig();

    SQLiteCheckpointStore store(dbFile);
    FsSourceStore source(sourceDir);
    FsTargetStore target(targetDir);
    TraceSink sink;
    MigrationController controller(store, source, target, sink);

    id = controller.start(config);

    runForeground(&controller, id);
}
