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

/** @page artifacts Artifacts and work units

    An artifact is an immutable object of the source store. Its identity
    is the store relative path and serves as primary key within a run.
    The declared checksum is the lower case hex SHA-256 digest of the
    content. It may be empty if the source does not provide one.

    Work units (batches) are ordered groups of artifacts created by the
    Partitioner. A work unit is not changed after it has been formed.
 */

struct Artifact
{
    std::string identity;
    unsigned long size = 0;
    std::string checksum;
    std::string contentType;
    std::map<std::string, std::string> metadata;
};

struct WorkUnit
{
    int batchNum = 0;
    std::vector<Artifact> artifacts;
    unsigned long bytes = 0;
};
