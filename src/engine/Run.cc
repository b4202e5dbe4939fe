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

std::string RunInfo::stateStr(RunInfo::run_state state)

{
    switch (state) {
        case CREATED:
            return pkgmig_messages[PKGMIGX0030I];
        case LISTING:
            return pkgmig_messages[PKGMIGX0031I];
        case PARTITIONING:
            return pkgmig_messages[PKGMIGX0032I];
        case RUNNING:
            return pkgmig_messages[PKGMIGX0033I];
        case PAUSED:
            return pkgmig_messages[PKGMIGX0034I];
        case COMPLETED:
            return pkgmig_messages[PKGMIGX0035I];
        case FAILED:
            return pkgmig_messages[PKGMIGX0036I];
        default:
            return "";
    }
}
