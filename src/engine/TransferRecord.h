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

/** @page transfer_records Transfer records

    For each artifact of a run a transfer record is kept within the
    checkpoint store. The state transitions are:

    @dot
    digraph record {
        node [shape=box, fontname="courier", fontsize=11];
        pending -> in_progress;
        in_progress -> validated;
        validated -> committed;
        in_progress -> failed_retryable;
        in_progress -> failed_fatal;
        failed_retryable -> in_progress;
        in_progress -> pending [label="pause/crash"];
        validated -> pending [label="crash"];
    }
    @enddot

    The states committed and failed_fatal are final.
 */

class TransferRecord
{
public:
    enum state_t
    {
        PENDING,          /**@< 0 */
        IN_PROGRESS,      /**@< 1 */
        VALIDATED,        /**@< 2 */
        COMMITTED,        /**@< 3 */
        FAILED_RETRYABLE, /**@< 4 */
        FAILED_FATAL      /**@< 5 */
    };

    state_t state = PENDING;
    time_t lastAttempt = 0;
    int attempts = 0;
    std::string errorClass;
    std::string errorDetail;
    std::string checksum;
    unsigned long bytes = 0;

    static std::string stateStr(state_t state);
    static bool isTerminal(state_t state)
    {
        return state == COMMITTED || state == FAILED_FATAL;
    }
};
