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

class Partitioner
{
private:
    unsigned long batchArtifactCount;
    unsigned long batchByteSize;
public:
    Partitioner(unsigned long batchArtifactCount_,
            unsigned long batchByteSize_) :
            batchArtifactCount(batchArtifactCount_), batchByteSize(
                    batchByteSize_)
    {
    }
    Partitioner(const StrategyParams& params) :
            batchArtifactCount(params.batchArtifactCount), batchByteSize(
                    params.batchByteSize)
    {
    }
    std::vector<WorkUnit> partition(
            const std::vector<Artifact>& artifacts) const;
};
