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

class RunInfo
{
public:
    enum run_state
    {
        CREATED,      /**@< 0 */
        LISTING,      /**@< 1 */
        PARTITIONING, /**@< 2 */
        RUNNING,      /**@< 3 */
        PAUSED,       /**@< 4 */
        COMPLETED,    /**@< 5 */
        FAILED        /**@< 6 */
    };

    long runId = Const::UNSET;
    long priorRunId = Const::UNSET;
    strategy_t strategy = strategy_t::AUTO;
    run_state state = CREATED;
    time_t startTime = 0;
    time_t endTime = 0;
    unsigned long total = 0;
    long pid = 0;
    unsigned long committed = 0;
    unsigned long failedRetryable = 0;
    unsigned long failedFatal = 0;
    unsigned long skipped = 0;
    unsigned long conflicts = 0;
    unsigned long bytes = 0;
    std::string reason;

    static std::string stateStr(run_state state);
    static bool isTerminal(run_state state)
    {
        return state == COMPLETED || state == FAILED;
    }
};
