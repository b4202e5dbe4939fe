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

void ObservabilitySink::count(std::string name, long value) noexcept

{
    try {
        addCounter(name, value);
    } catch (const std::exception& e) {
        TRACE(Trace::error, name, value, e.what());
    }
}

void ObservabilitySink::event(std::string name, std::string identity,
        std::string detail) noexcept

{
    try {
        addEvent(name, identity, detail);
    } catch (const std::exception& e) {
        TRACE(Trace::error, name, identity, e.what());
    }
}

void TraceSink::addCounter(std::string name, long value)

{
    std::lock_guard<std::mutex> lock(mtx);

    counters[name] += value;
    TRACE(Trace::full, name, counters[name]);
}

void TraceSink::addEvent(std::string name, std::string identity,
        std::string detail)

{
    TRACE(Trace::normal, name, identity, detail);
}

long TraceSink::getCounter(std::string name)

{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = counters.find(name);

    if (it == counters.end())
        return 0;

    return it->second;
}
