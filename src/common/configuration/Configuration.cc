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
#include <errno.h>

#include <string>
#include <sstream>
#include <fstream>
#include <vector>
#include <mutex>

#include "src/common/errors/errors.h"
#include "src/common/exception/PkgMigException.h"
#include "src/common/util/util.h"
#include "src/common/messages/Message.h"
#include "src/common/tracing/Trace.h"
#include "src/common/const/Const.h"

#include "Configuration.h"

std::string Configuration::strategyStr(strategy_t strategy)

{
    switch (strategy) {
        case strategy_t::SMALL:
            return "small";
        case strategy_t::MEDIUM:
            return "medium";
        case strategy_t::LARGE:
            return "large";
        case strategy_t::AUTO:
            return "auto";
        default:
            return "";
    }
}

strategy_t Configuration::strategyFromStr(std::string str)

{
    if (str.compare("small") == 0)
        return strategy_t::SMALL;
    else if (str.compare("medium") == 0)
        return strategy_t::MEDIUM;
    else if (str.compare("large") == 0)
        return strategy_t::LARGE;
    else if (str.compare("auto") == 0)
        return strategy_t::AUTO;

    MSG(PKGMIGX0010E, "strategyHint", str);
    THROW(Error::CONFIG_FORMAT_ERROR, str);
}

long Configuration::toLong(const std::string& key, const std::string& value)

{
    size_t pos = 0;
    long result;

    try {
        result = std::stol(value, &pos);
    } catch (const std::exception& e) {
        TRACE(Trace::error, key, value, e.what());
        MSG(PKGMIGX0010E, key, value);
        THROW(Error::CONFIG_FORMAT_ERROR, key, value);
    }

    if (pos != value.size()) {
        MSG(PKGMIGX0010E, key, value);
        THROW(Error::CONFIG_FORMAT_ERROR, key, value);
    }

    return result;
}

double Configuration::toDouble(const std::string& key,
        const std::string& value)

{
    size_t pos = 0;
    double result;

    try {
        result = std::stod(value, &pos);
    } catch (const std::exception& e) {
        TRACE(Trace::error, key, value, e.what());
        MSG(PKGMIGX0010E, key, value);
        THROW(Error::CONFIG_FORMAT_ERROR, key, value);
    }

    if (pos != value.size()) {
        MSG(PKGMIGX0010E, key, value);
        THROW(Error::CONFIG_FORMAT_ERROR, key, value);
    }

    return result;
}

void Configuration::validate(const MigrationConfig& cfg)

{
    std::string key;

    if (cfg.concurrencyLimit < 0)
        key = "concurrencyLimit";
    else if (cfg.poolInstances < 0)
        key = "poolInstances";
    else if (cfg.maxRetries < 0)
        key = "maxRetries";
    else if (cfg.backoffBaseMs < 0)
        key = "backoffBaseMs";
    else if (cfg.backoffFactor < 1.0)
        key = "backoffFactor";
    else if (cfg.backoffCapMs < 0)
        key = "backoffCapMs";
    else if (cfg.rateLimitSource < 0)
        key = "rateLimitSource";
    else if (cfg.rateLimitTarget < 0)
        key = "rateLimitTarget";
    else if (cfg.acquireTimeoutMs < 0)
        key = "acquireTimeoutMs";
    else if (cfg.systemicFailureThreshold < 0)
        key = "systemicFailureThreshold";
    else
        return;

    MSG(PKGMIGX0011E, key);
    THROW(Error::CONFIG_VALUE_ERROR, key);
}

void Configuration::setOption(std::string key, std::string value)

{
    std::lock_guard<std::mutex> lock(mtx);
    MigrationConfig cfg = config;
    long num;

    key = PKGMIG::trim(key);
    value = PKGMIG::trim(value);

    TRACE(Trace::normal, key, value);

    if (key.compare("strategyHint") == 0) {
        cfg.strategyHint = strategyFromStr(value);
    } else if (key.compare("concurrencyLimit") == 0) {
        cfg.concurrencyLimit = toLong(key, value);
    } else if (key.compare("batchArtifactCount") == 0) {
        if ((num = toLong(key, value)) < 0) {
            MSG(PKGMIGX0011E, key);
            THROW(Error::CONFIG_VALUE_ERROR, key, value);
        }
        cfg.batchArtifactCount = num;
    } else if (key.compare("batchByteSize") == 0) {
        if ((num = toLong(key, value)) < 0) {
            MSG(PKGMIGX0011E, key);
            THROW(Error::CONFIG_VALUE_ERROR, key, value);
        }
        cfg.batchByteSize = num;
    } else if (key.compare("poolInstances") == 0) {
        cfg.poolInstances = toLong(key, value);
    } else if (key.compare("maxRetries") == 0) {
        cfg.maxRetries = toLong(key, value);
    } else if (key.compare("backoffBaseMs") == 0) {
        cfg.backoffBaseMs = toLong(key, value);
    } else if (key.compare("backoffFactor") == 0) {
        cfg.backoffFactor = toDouble(key, value);
    } else if (key.compare("backoffCapMs") == 0) {
        cfg.backoffCapMs = toLong(key, value);
    } else if (key.compare("rateLimitSource") == 0) {
        cfg.rateLimitSource = toDouble(key, value);
    } else if (key.compare("rateLimitTarget") == 0) {
        cfg.rateLimitTarget = toDouble(key, value);
    } else if (key.compare("acquireTimeoutMs") == 0) {
        cfg.acquireTimeoutMs = toLong(key, value);
    } else if (key.compare("systemicFailureThreshold") == 0) {
        cfg.systemicFailureThreshold = toLong(key, value);
    } else if (key.compare("resumeFromRun") == 0) {
        cfg.resumeFromRun = toLong(key, value);
    } else {
        MSG(PKGMIGX0009E, key);
        THROW(Error::CONFIG_FORMAT_ERROR, key);
    }

    validate(cfg);
    config = cfg;
}

void Configuration::setOption(std::string keyValue)

{
    size_t pos = keyValue.find('=');

    if (pos == std::string::npos) {
        MSG(PKGMIGX0008E, keyValue);
        THROW(Error::CONFIG_FORMAT_ERROR, keyValue);
    }

    setOption(keyValue.substr(0, pos), keyValue.substr(pos + 1));
}

void Configuration::read(std::string fileName, bool mustExist)

{
    std::ifstream conffile(fileName);
    std::string line;
    size_t pos;

    if (!conffile.is_open()) {
        if (mustExist) {
            MSG(PKGMIGX0012E, fileName);
            THROW(Error::CONFIG_FORMAT_ERROR, fileName, errno);
        }
        TRACE(Trace::normal, fileName);
        return;
    }

    while (std::getline(conffile, line)) {
        line = PKGMIG::trim(line);

        if (line.size() == 0 || line[0] == '#')
            continue;

        if ((pos = line.find(':')) == std::string::npos) {
            MSG(PKGMIGX0008E, line);
            THROW(Error::CONFIG_FORMAT_ERROR, fileName, line);
        }

        setOption(line.substr(0, pos), line.substr(pos + 1));
    }
}

MigrationConfig Configuration::get()

{
    std::lock_guard<std::mutex> lock(mtx);

    return config;
}

std::string Configuration::str()

{
    std::lock_guard<std::mutex> lock(mtx);
    std::stringstream ss;

    ss << "strategyHint: " << strategyStr(config.strategyHint) << std::endl
            << "concurrencyLimit: " << config.concurrencyLimit << std::endl
            << "batchArtifactCount: " << config.batchArtifactCount
            << std::endl << "batchByteSize: " << config.batchByteSize
            << std::endl << "poolInstances: " << config.poolInstances
            << std::endl << "maxRetries: " << config.maxRetries << std::endl
            << "backoffBaseMs: " << config.backoffBaseMs << std::endl
            << "backoffFactor: " << config.backoffFactor << std::endl
            << "backoffCapMs: " << config.backoffCapMs << std::endl
            << "rateLimitSource: " << config.rateLimitSource << std::endl
            << "rateLimitTarget: " << config.rateLimitTarget << std::endl
            << "acquireTimeoutMs: " << config.acquireTimeoutMs << std::endl
            << "systemicFailureThreshold: "
            << config.systemicFailureThreshold << std::endl
            << "resumeFromRun: " << config.resumeFromRun << std::endl;

    return ss.str();
}
