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

/**
 @page client_code Client Code

 # Class Hierarchy

 For each of the commands there exists a separate class that is derived
 from the @ref PkgMigCommand class. The class name of a command
 consists of the string "Command" that is appended to the command name,
 e.g. @ref StartCommand for "pkgmig start" and @ref InfoRunsCommand for
 "pkgmig info runs". Any new command should follow this rule.

 The actual processing of a command happens within the virtual
 PkgMigCommand::doCommand method.

 # Command evaluation

 For all commands the first and for the info commands also the second
 argument of the pkgmig executable is evaluated. The matching command
 object is created and its doCommand method is called with the
 remaining arguments.

 # Signals

 SIGINT, SIGTERM and SIGQUIT are handled by a separate thread that
 sets exitClient. A run processed in the foreground is paused
 thereupon. SIGUSR1 terminates the signal handling thread at the end
 of the program.
 */

std::atomic<bool> exitClient(false);

void signalHandler(sigset_t set)

{
    int sig;

    while (true) {
        if (sigwait(&set, &sig))
            continue;
        if (sig == SIGUSR1)
            return;
        TRACE(Trace::always, sig);
        exitClient = true;
    }
}

int main(int argc, char *argv[])

{
    std::unique_ptr<PkgMigCommand> pkgmigCommand(nullptr);
    std::string command;
    int rc = static_cast<int>(Error::OK);
    sigset_t set;

    sigemptyset(&set);
    sigaddset(&set, SIGQUIT);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGPIPE);
    sigaddset(&set, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &set, NULL);

    std::thread sigHandler(signalHandler, set);

    try {
        PKGMIG::init();
    } catch (const std::exception& e) {
        rc = Const::COMMAND_FAILED;
        goto end;
    }

    traceObject.setTrclevel(Trace::error);

    if (argc < 2) {
        pkgmigCommand = std::unique_ptr<PkgMigCommand>(new HelpCommand);
        pkgmigCommand->doCommand(argc, argv);
        rc = Const::COMMAND_FAILED;
        goto end;
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
            MSG(PKGMIGC0017E);
            InfoCommand().printUsage();
            rc = Const::COMMAND_FAILED;
            goto end;
        }
        argc--;
        argv++;
        command = argv[1];
        TRACE(Trace::normal, command);
        if (InfoRunsCommand().compare(command)) {
            pkgmigCommand = std::unique_ptr<PkgMigCommand>(
                    new InfoRunsCommand);
        } else if (InfoFailedCommand().compare(command)) {
            pkgmigCommand = std::unique_ptr<PkgMigCommand>(
                    new InfoFailedCommand);
        } else {
            MSG(PKGMIGC0018E, command);
            InfoCommand().printUsage();
            rc = Const::COMMAND_FAILED;
            goto end;
        }
    } else {
        MSG(PKGMIGC0002E, command);
        HelpCommand().printUsage();
        rc = Const::COMMAND_FAILED;
        goto end;
    }

    TRACE(Trace::normal, pkgmigCommand->getCommand());

    argc--;
    argv++;

    try {
        pkgmigCommand->doCommand(argc, argv);
    } catch (const PkgMigException& e) {
        TRACE(Trace::error, e.what());
        switch (e.getError()) {
            case Error::OK:
                break;
            case Error::COMMAND_PARTIALLY_FAILED:
                rc = Const::COMMAND_PARTIALLY_FAILED;
                break;
            default:
                rc = Const::COMMAND_FAILED;
        }
    } catch (const std::exception& e) {
        TRACE(Trace::error, e.what());
        MSG(PKGMIGC0019E, e.what());
        rc = Const::COMMAND_FAILED;
    }

    end:

    kill(getpid(), SIGUSR1);
    sigHandler.join();

    return rc;
}
