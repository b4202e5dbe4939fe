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

enum class Error
{
    GENERAL_ERROR = -1,
    OK = 0,

    REMOTE_NETWORK = 1001,
    REMOTE_THROTTLED = 1002,
    REMOTE_SERVER_ERROR = 1003,
    REMOTE_TIMEOUT = 1004,
    RATE_LIMIT_TIMEOUT = 1005,

    REMOTE_AUTHORIZATION = 1010,
    REMOTE_MALFORMED_REQUEST = 1011,
    REMOTE_NOT_FOUND = 1012,

    INTEGRITY_MISMATCH = 1020,

    CHECKPOINT_CONFLICT = 1030,
    CHECKPOINT_ERROR = 1031,

    CONFIG_FORMAT_ERROR = 1040,
    CONFIG_VALUE_ERROR = 1041,

    RUN_NOT_EXISTS = 1050,
    RUN_STATE_ERR = 1051,
    RUN_NOT_OWNED = 1052,
    TERMINATING = 1053,

    COMMAND_PARTIALLY_FAILED = 2001,
    COMMAND_FAILED = 2002,
};
