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

/** @page strategies Strategies

    The three load regimes only differ in the parameters of the
    partitioning and of the worker pool:

    strategy | concurrency | batch count | batch bytes | pool instances
    ---|---|---|---|---
    small | 1 | 1 | unbounded | 1
    medium | 10 | 100 | 256 MiB | 1
    large | 32 | 1000 | 1 GiB | 4

    For the strategy hint auto the strategy is selected by the sum of
    the declared sizes of the listing: small below 100 MiB, medium below
    100 GiB and large otherwise. Values specified within the
    configuration (not 0) take precedence over the table.
 */

struct StrategyParams
{
    strategy_t strategy = strategy_t::SMALL;
    int concurrencyLimit = 1;
    unsigned long batchArtifactCount = 1;
    unsigned long batchByteSize = 0;
    int poolInstances = 1;

    static strategy_t fromEstimate(unsigned long totalBytes);
    static StrategyParams forStrategy(strategy_t strategy);
    static StrategyParams select(const MigrationConfig& config,
            unsigned long totalBytes);
};
