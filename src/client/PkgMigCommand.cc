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

static long toRunNumber(const char *str, char opt)

{
    char *endptr = NULL;
    long value;

    errno = 0;
    value = strtol(str, &endptr, 0);
    if (errno != 0 || endptr == str || *endptr != '\0' || value < 0) {
        MSG(PKGMIGC0005E, str, opt);
        THROW(Error::GENERAL_ERROR, str);
    }

    return value;
}

void PkgMigCommand::processOptions(int argc, char **argv)

{
    int opt;

    opterr = 0;

    while ((opt = getopt(argc, argv, optionStr.c_str())) != -1) {
        switch (opt) {
            case 'h':
                printUsage();
                THROW(Error::OK);
            case 's':
                sourceDir = std::string(optarg);
                break;
            case 't':
                targetDir = std::string(optarg);
                break;
            case 'c':
                configFile = std::string(optarg);
                break;
            case 'S':
                strategy = std::string(optarg);
                break;
            case 'r':
                priorRunId = toRunNumber(optarg, opt);
                break;
            case 'n':
                runId = toRunNumber(optarg, opt);
                break;
            case 'b':
                batchCount = toRunNumber(optarg, opt);
                break;
            case 'm':
                maxRetries = toRunNumber(optarg, opt);
                break;
            case 'o':
                options.push_back(std::string(optarg));
                break;
            case 'd':
                dbFile = std::string(optarg);
                break;
            case ':':
                INFO(PKGMIGC0003E);
                printUsage();
                THROW(Error::GENERAL_ERROR);
            default:
                INFO(PKGMIGC0004E);
                printUsage();
                THROW(Error::GENERAL_ERROR);
        }
    }
}

void PkgMigCommand::traceParms()

{
    TRACE(Trace::normal, command, optionStr);
    TRACE(Trace::normal, sourceDir, targetDir, configFile, dbFile);
    TRACE(Trace::normal, strategy, priorRunId, runId, batchCount, maxRetries);
    TRACE(Trace::normal, options.size());
}

void PkgMigCommand::checkOptions(int argc, char **argv)

{
    if (optind != argc) {
        MSG(PKGMIGC0006E, argv[optind]);
        printUsage();
        THROW(Error::GENERAL_ERROR);
    }
}

void PkgMigCommand::checkStores()

{
    struct stat statbuf;

    if (sourceDir.size() == 0 || targetDir.size() == 0) {
        MSG(PKGMIGC0007E);
        printUsage();
        THROW(Error::GENERAL_ERROR);
    }

    for (std::string dir : { sourceDir, targetDir }) {
        if (stat(dir.c_str(), &statbuf) == -1 || !S_ISDIR(statbuf.st_mode)) {
            MSG(PKGMIGC0008E, dir);
            THROW(Error::GENERAL_ERROR, dir, errno);
        }
    }
}

MigrationConfig PkgMigCommand::getConfig()

{
    Configuration conf;

    if (configFile.size() != 0)
        conf.read(configFile, true);
    else
        conf.read();

    if (strategy.size() != 0)
        conf.setOption("strategyHint", strategy);
    if (priorRunId != Const::UNSET)
        conf.setOption("resumeFromRun", std::to_string(priorRunId));
    if (batchCount != Const::UNSET)
        conf.setOption("batchArtifactCount", std::to_string(batchCount));
    if (maxRetries != Const::UNSET)
        conf.setOption("maxRetries", std::to_string(maxRetries));

    for (std::string option : options)
        conf.setOption(option);

    TRACE(Trace::normal, conf.str());

    return conf.get();
}

void PkgMigCommand::runForeground(MigrationController *controller, long runId)

{
    RunInfo::run_state state;
    RunStatus st;

    while (controller->isActive(runId)) {
        if (exitClient) {
            INFO(PKGMIGC0020I, runId);
            try {
                controller->pause(runId);
            } catch (const PkgMigException& e) {
                // the run has been finished in the meantime
                if (e.getError() != Error::RUN_STATE_ERR)
                    throw;
                TRACE(Trace::normal, runId, e.what());
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    state = controller->wait(runId);
    st = controller->status(runId);

    TRACE(Trace::normal, runId, state, st.failures.size());

    switch (state) {
        case RunInfo::COMPLETED:
            if (st.run.failedFatal + st.run.failedRetryable != 0)
                THROW(Error::COMMAND_PARTIALLY_FAILED, runId);
            break;
        case RunInfo::PAUSED:
            INFO(PKGMIGC0021I, runId, runId);
            break;
        default:
            THROW(Error::COMMAND_FAILED, runId, state);
    }
}
