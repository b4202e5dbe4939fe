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
#include "ResumeCommand.h"
#include "PauseCommand.h"
#include "StatusCommand.h"
#include "InfoCommand.h"
#include "InfoRunsCommand.h"
#include "InfoFailedCommand.h"
#include "HelpCommand.h"

/** @page pkgmig_help pkgmig help
    The pkgmig help command lists all available client interface commands.
    If a command is specified as argument the usage of that command is
    printed.

    Example:

    @verbatim
    [root@visp ~]# pkgmig help
    commands:
               pkgmig help              - show this help message
               pkgmig start             - start a migration run in the foreground
               pkgmig resume            - resume a paused or interrupted run
               pkgmig pause             - pause a run processed by another process
               pkgmig status            - show the report of a run
    info sub commands:
               pkgmig info runs         - list all runs
               pkgmig info failed       - list the failed artifacts of a run
    @endverbatim

    The corresponding class is @ref HelpCommand.
 */

void HelpCommand::printUsage()

{
    INFO(PKGMIGC0001I);
}

void HelpCommand::doCommand(int argc, char **argv)

{
    std::unique_ptr<PkgMigCommand> pkgmigCommand(nullptr);
    std::string command;

    if (argc < 2) {
        printUsage();
        return;
    }

    command = argv[1];

    TRACE(Trace::normal, argc, command);

    if (StartCommand().compare(command)) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new StartCommand);
    } else if (ResumeCommand().compare(command)) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new ResumeCommand);
    } else if (PauseCommand().compare(command)) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new PauseCommand);
    } else if (StatusCommand().compare(command)) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new StatusCommand);
    } else if (HelpCommand().compare(command)) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new HelpCommand);
    } else if (InfoCommand().compare(command)) {
        if (argc < 3) {
            pkgmigCommand = std::unique_ptr<PkgMigCommand>(new InfoCommand);
        } else {
            command = argv[2];
            if (InfoRunsCommand().compare(command))
                pkgmigCommand = std::unique_ptr<PkgMigCommand>(
                        new InfoRunsCommand);
            else if (InfoFailedCommand().compare(command))
                pkgmigCommand = std::unique_ptr<PkgMigCommand>(
                        new InfoFailedCommand);
            else
                pkgmigCommand = std::unique_ptr<PkgMigCommand>(
                        new InfoCommand);
        }
    } else {
        printUsage();
        return;
    }

    pkgmigCommand->printUsage();
}
