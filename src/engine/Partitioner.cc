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

/** @page partitioning Partitioning

    The residual artifacts of a run are split into work units in listing
    order. A work unit is closed if it either contains batchArtifactCount
    artifacts or if the next artifact would exceed batchByteSize. A value
    of 0 means unbounded. An artifact is never split: an artifact that is
    larger than batchByteSize forms a work unit on its own. The result
    only depends on the input.
 */

std::vector<WorkUnit> Partitioner::partition(
        const std::vector<Artifact>& artifacts) const

{
    std::vector<WorkUnit> units;
    WorkUnit unit;

    for (const Artifact& artifact : artifacts) {
        if (unit.artifacts.size() > 0
                && ((batchArtifactCount > 0
                        && unit.artifacts.size() >= batchArtifactCount)
                        || (batchByteSize > 0
                                && unit.bytes + artifact.size > batchByteSize))) {
            units.push_back(unit);
            unit = WorkUnit();
            unit.batchNum = units.size();
        }
        unit.artifacts.push_back(artifact);
        unit.bytes += artifact.size;
    }

    if (unit.artifacts.size() > 0)
        units.push_back(unit);

    TRACE(Trace::normal, artifacts.size(), units.size(), batchArtifactCount,
            batchByteSize);

    return units;
}
