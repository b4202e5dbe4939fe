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
#include "EngineIncludes.h"

strategy_t StrategyParams::fromEstimate(unsigned long totalBytes)

{
    if (totalBytes < Const::SMALL_SCALE_LIMIT)
        return strategy_t::SMALL;
    else if (totalBytes < Const::MEDIUM_SCALE_LIMIT)
        return strategy_t::MEDIUM;
    else
        return strategy_t::LARGE;
}

StrategyParams StrategyParams::forStrategy(strategy_t strategy)

{
    StrategyParams params;

    params.strategy = strategy;

    switch (strategy) {
        case strategy_t::MEDIUM:
            params.concurrencyLimit = 10;
            params.batchArtifactCount = 100;
            params.batchByteSize = MB(256);
            params.poolInstances = 1;
            break;
        case strategy_t::LARGE:
            params.concurrencyLimit = 32;
            params.batchArtifactCount = 1000;
            params.batchByteSize = GB(1);
            params.poolInstances = 4;
            break;
        default:
            params.strategy = strategy_t::SMALL;
            params.concurrencyLimit = 1;
            params.batchArtifactCount = 1;
            params.batchByteSize = 0;
            params.poolInstances = 1;
    }

    return params;
}

StrategyParams StrategyParams::select(const MigrationConfig& config,
        unsigned long totalBytes)

{
    strategy_t strategy = config.strategyHint;
    StrategyParams params;

    if (strategy == strategy_t::AUTO)
        strategy = fromEstimate(totalBytes);

    params = forStrategy(strategy);

    if (config.concurrencyLimit > 0)
        params.concurrencyLimit = config.concurrencyLimit;
    if (config.batchArtifactCount > 0)
        params.batchArtifactCount = config.batchArtifactCount;
    if (config.batchByteSize > 0)
        params.batchByteSize = config.batchByteSize;
    if (config.poolInstances > 0)
        params.poolInstances = config.poolInstances;

    TRACE(Trace::normal, Configuration::strategyStr(params.strategy),
            totalBytes, params.concurrencyLimit, params.batchArtifactCount,
            params.batchByteSize, params.poolInstances);

    return params;
}
