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

/** @page observability Observability

    Counters and events of the migration engine are passed to an
    ObservabilitySink. The sink is fire-and-forget: exceptions thrown by
    an implementation are traced and do not reach the caller.

    counter | meaning
    ---|---
    attempts | transfer attempts started
    successes | artifacts committed
    failures.<error class> | attempts failed with the given error class
    wait.<bucket> | accumulated rate limiter wait time in milliseconds

    events: committed, failed_fatal
 */

class ObservabilitySink
{
protected:
    virtual void addCounter(std::string name, long value) = 0;
    virtual void addEvent(std::string name, std::string identity,
            std::string detail) = 0;
public:
    virtual ~ObservabilitySink()
    {
    }
    void count(std::string name, long value = 1) noexcept;
    void event(std::string name, std::string identity,
            std::string detail = "") noexcept;
};

class TraceSink: public ObservabilitySink
{
private:
    std::mutex mtx;
    std::map<std::string, long> counters;
protected:
    void addCounter(std::string name, long value);
    void addEvent(std::string name, std::string identity, std::string detail);
public:
    long getCounter(std::string name);
};
