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

std::string TransferRecord::stateStr(TransferRecord::state_t state)

{
    switch (state) {
        case PENDING:
            return pkgmig_messages[PKGMIGX0020I];
        case IN_PROGRESS:
            return pkgmig_messages[PKGMIGX0021I];
        case VALIDATED:
            return pkgmig_messages[PKGMIGX0022I];
        case COMMITTED:
            return pkgmig_messages[PKGMIGX0023I];
        case FAILED_RETRYABLE:
            return pkgmig_messages[PKGMIGX0024I];
        case FAILED_FATAL:
            return pkgmig_messages[PKGMIGX0025I];
        default:
            return "";
    }
}
