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

/** @page client_code Client Code

 # Options

 Some commands do an additional option processing. Each option has a
 particular meaning even it is used by different commands. The option
 processing is performed within the single method
 PkgMigCommand::processOptions. The following is a list of all options:

 option | meaning
 ---|---
 -h                     | show the usage
 -s @<directory@>       | the root directory of the source store
 -t @<directory@>       | the root directory of the target store
 -c @<file name@>       | the configuration file (default /etc/pkgmig.conf)
 -S @<strategy@>        | the strategy hint: small, medium, large or auto
 -r @<run id@>          | a prior run whose committed artifacts are skipped
 -n @<run id@>          | the run id
 -b @<count@>           | the maximum number of artifacts per work unit
 -m @<count@>           | the maximum number of retries
 -o @<key=value@>       | set a configuration option, can be repeated
 -d @<file name@>       | the checkpoint data base (default /var/run/pkgmig/PKGMIG.db)

 The PkgMigCommand::checkOptions method checks if all arguments have
 been consumed.

 # Command processing

 There is no separate backend. The start and resume commands run the
 migration engine within the client process, print the progress and
 wait until the run has been finished or paused. Pausing is performed
 by sending SIGTERM to the process that owns the run, which is what
 the pause command does. The remaining commands read the checkpoint
 data base only.

 item | description | same implementation for all commands
 ---|---|:---:
 doCommand | performs all required operations for a certain command | no
 PkgMigCommand::processOptions | option processing | yes
 PkgMigCommand::checkOptions | checks the number of arguments | yes
 PkgMigCommand::getConfig | assembles the migration parameters | yes
 PkgMigCommand::runForeground | waits for the end of a run and evaluates the result | yes

 */

extern std::atomic<bool> exitClient;

class PkgMigCommand
{
protected:
    PkgMigCommand(std::string command_, std::string optionStr_) :
            command(command_), optionStr(optionStr_), sourceDir(""), targetDir(
                    ""), configFile(""), strategy(""), priorRunId(
                    Const::UNSET), runId(Const::UNSET), batchCount(
                    Const::UNSET), maxRetries(Const::UNSET), dbFile(
                    Const::DB_FILE)
    {
    }
    std::string command;
    std::string optionStr;
    std::string sourceDir;
    std::string targetDir;
    std::string configFile;
    std::string strategy;
    long priorRunId;
    long runId;
    long batchCount;
    long maxRetries;
    std::vector<std::string> options;
    std::string dbFile;

    void checkOptions(int argc, char **argv);
    void checkStores();
    MigrationConfig getConfig();
    void runForeground(MigrationController *controller, long runId);

public:
    virtual ~PkgMigCommand()
    {
    }
    virtual void printUsage() = 0;
    virtual void doCommand(int argc, char **argv) = 0;

    // non-virtual methods
    void processOptions(int argc, char **argv);
    void traceParms();
    bool compare(std::string name)
    {
        return !command.compare(name);
    }
    std::string getCommand()
    {
        return command;
    }
};
