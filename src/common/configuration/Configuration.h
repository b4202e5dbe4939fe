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

#include <string>
#include <mutex>

#include "src/common/const/Const.h"

/** @page configuration Configuration

    The migration parameters are read from a configuration file
    (default: /etc/pkgmig.conf). Each line has the form

    @verbatim
    key: value
    @endverbatim

    Lines starting with '#' and empty lines are ignored. Options
    specified on the command line (-o key=value) override values of
    the configuration file. A value of 0 for concurrencyLimit,
    batchArtifactCount, batchByteSize and poolInstances means that the
    value is taken from the strategy table, see StrategyParams.

    key | meaning
    ---|---
    strategyHint | small, medium, large or auto
    concurrencyLimit | number of transfer slots per pool instance
    batchArtifactCount | maximum number of artifacts per work unit
    batchByteSize | maximum number of bytes per work unit
    poolInstances | number of pool instances consuming work units
    maxRetries | number of re-attempts for retryable failures
    backoffBaseMs | base of the exponential backoff delay
    backoffFactor | factor of the exponential backoff delay
    backoffCapMs | upper bound of the backoff delay
    rateLimitSource | tokens per second for the source, 0: unlimited
    rateLimitTarget | tokens per second for the target, 0: unlimited
    acquireTimeoutMs | maximum wait time for a rate limiter token
    systemicFailureThreshold | consecutive exhausted artifacts failing the run
    resumeFromRun | run whose committed artifacts are skipped
 */

enum class strategy_t
{
    SMALL, MEDIUM, LARGE, AUTO
};

struct MigrationConfig
{
    strategy_t strategyHint = strategy_t::AUTO;
    int concurrencyLimit = 0;
    unsigned long batchArtifactCount = 0;
    unsigned long batchByteSize = 0;
    int poolInstances = 0;
    int maxRetries = Const::DEFAULT_MAX_RETRIES;
    long backoffBaseMs = Const::DEFAULT_BACKOFF_BASE_MS;
    double backoffFactor = Const::DEFAULT_BACKOFF_FACTOR;
    long backoffCapMs = Const::DEFAULT_BACKOFF_CAP_MS;
    double rateLimitSource = 0;
    double rateLimitTarget = 0;
    long acquireTimeoutMs = Const::DEFAULT_ACQUIRE_TIMEOUT_MS;
    int systemicFailureThreshold = Const::DEFAULT_SYSTEMIC_FAILURE_THRESHOLD;
    long resumeFromRun = Const::UNSET;
};

class Configuration
{
private:
    MigrationConfig config;
    std::mutex mtx;

    static long toLong(const std::string& key, const std::string& value);
    static double toDouble(const std::string& key, const std::string& value);
    void validate(const MigrationConfig& cfg);
public:
    Configuration()
    {
    }
    void read(std::string fileName = Const::CONFIG_FILE, bool mustExist =
            false);
    void setOption(std::string key, std::string value);
    void setOption(std::string keyValue);
    MigrationConfig get();
    std::string str();

    static std::string strategyStr(strategy_t strategy);
    static strategy_t strategyFromStr(std::string str);
};
