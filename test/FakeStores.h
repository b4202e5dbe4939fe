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

#include "src/engine/EngineIncludes.h"

/**
    In-process source and target stores. Failures can be injected per
    identity for a given number of calls or for all calls.
 */

static std::string readAll(ContentReader& content)

{
    char buffer[7];
    std::string all;
    size_t num;

    // small chunks so that the streaming is exercised
    while ((num = content.read(buffer, sizeof(buffer))) != 0)
        all.append(buffer, num);

    return all;
}

class FakeSourceStore: public SourceStore
{
private:
    std::mutex mtx;
    std::map<std::string, std::string> objects;
    std::map<std::string, std::string> declared;
    std::map<std::string, std::deque<Error>> readFaults;
    std::deque<Error> listFaults;
    std::map<std::string, int> reads;
    std::vector<std::string> duplicates;
public:
    void add(std::string identity, std::string content)
    {
        std::lock_guard<std::mutex> lock(mtx);

        objects[identity] = content;
        declared[identity] = Validator::digest(content);
    }

    // the listing declares a checksum that does not match the content
    void declareChecksum(std::string identity, std::string checksum)
    {
        std::lock_guard<std::mutex> lock(mtx);

        declared[identity] = checksum;
    }

    void remove(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        objects.erase(identity);
    }

    void duplicate(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        duplicates.push_back(identity);
    }

    void failRead(std::string identity, Error error, int times)
    {
        std::lock_guard<std::mutex> lock(mtx);

        for (int i = 0; i < times; i++)
            readFaults[identity].push_back(error);
    }

    void failList(Error error, int times)
    {
        std::lock_guard<std::mutex> lock(mtx);

        for (int i = 0; i < times; i++)
            listFaults.push_back(error);
    }

    int getReads(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        return reads[identity];
    }

    std::vector<Artifact> list()
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<Artifact> artifacts;

        if (listFaults.size() > 0) {
            Error error = listFaults.front();
            listFaults.pop_front();
            THROW(error, "list");
        }

        for (const auto& object : objects) {
            Artifact artifact;
            artifact.identity = object.first;
            artifact.size = object.second.size();
            artifact.checksum = declared[object.first];
            artifact.contentType = "application/octet-stream";
            artifacts.push_back(artifact);
        }

        for (std::string identity : duplicates)
            for (const Artifact& artifact : std::vector<Artifact>(artifacts))
                if (artifact.identity.compare(identity) == 0)
                    artifacts.push_back(artifact);

        return artifacts;
    }

    SourceObject read(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);
        SourceObject object;

        reads[identity]++;

        auto fit = readFaults.find(identity);
        if (fit != readFaults.end() && fit->second.size() > 0) {
            Error error = fit->second.front();
            fit->second.pop_front();
            THROW(error, identity);
        }

        auto it = objects.find(identity);
        if (it == objects.end())
            THROW(Error::REMOTE_NOT_FOUND, identity);

        object.content = std::unique_ptr<ContentReader>(
                new StringReader(it->second));
        object.size = it->second.size();
        object.contentType = "application/octet-stream";
        object.metadata["origin"] = "fake";

        return object;
    }
};

class FakeTargetStore: public TargetStore
{
private:
    std::mutex mtx;
    std::map<std::string, std::string> objects;
    std::map<std::string, std::deque<Error>> writeFaults;
    std::map<std::string, int> writes;
    std::map<std::string, std::string> corruptions;
    Error permanentFault;
    std::chrono::milliseconds delay;
    int inFlight;
    int maxInFlight;
public:
    FakeTargetStore() :
            permanentFault(Error::OK), delay(0), inFlight(0), maxInFlight(0)
    {
    }

    void failWrite(std::string identity, Error error, int times)
    {
        std::lock_guard<std::mutex> lock(mtx);

        for (int i = 0; i < times; i++)
            writeFaults[identity].push_back(error);
    }

    void failAllWrites(Error error)
    {
        std::lock_guard<std::mutex> lock(mtx);

        permanentFault = error;
    }

    // the target confirms a different content than it received
    void corrupt(std::string identity, std::string content)
    {
        std::lock_guard<std::mutex> lock(mtx);

        corruptions[identity] = content;
    }

    void setDelay(std::chrono::milliseconds delay_)
    {
        std::lock_guard<std::mutex> lock(mtx);

        delay = delay_;
    }

    int getWrites(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        return writes[identity];
    }

    bool contains(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        return objects.count(identity) != 0;
    }

    std::string get(std::string identity)
    {
        std::lock_guard<std::mutex> lock(mtx);

        return objects[identity];
    }

    int getMaxInFlight()
    {
        std::lock_guard<std::mutex> lock(mtx);

        return maxInFlight;
    }

    WriteConfirmation write(std::string identity, ContentReader& content,
            std::string contentType,
            const std::map<std::string, std::string>& metadata)
    {
        std::unique_lock<std::mutex> lock(mtx);
        WriteConfirmation confirmation;
        std::chrono::milliseconds wait = delay;
        std::string received;

        writes[identity]++;

        if (permanentFault != Error::OK)
            THROW(permanentFault, identity);

        auto fit = writeFaults.find(identity);
        if (fit != writeFaults.end() && fit->second.size() > 0) {
            Error error = fit->second.front();
            fit->second.pop_front();
            THROW(error, identity);
        }

        inFlight++;
        if (inFlight > maxInFlight)
            maxInFlight = inFlight;

        lock.unlock();
        try {
            received = readAll(content);
        } catch (const std::exception&) {
            lock.lock();
            inFlight--;
            throw;
        }
        std::this_thread::sleep_for(wait);
        lock.lock();

        inFlight--;

        auto cit = corruptions.find(identity);
        objects[identity] = cit != corruptions.end() ? cit->second : received;
        confirmation.checksum = Validator::digest(objects[identity]);
        confirmation.size = objects[identity].size();

        return confirmation;
    }
};

/**
    Checkpoint store that lets the first getRecord() callers wait for
    each other. This way several writers race for the same transfer
    record.
 */
class RendezvousStore: public CheckpointStore
{
private:
    CheckpointStore& store;
    std::mutex mtx;
    std::condition_variable cond;
    int parties;
    int arrived;
public:
    RendezvousStore(CheckpointStore& store_, int parties_) :
            store(store_), parties(parties_), arrived(0)
    {
    }

    long createRun(RunInfo *run)
    {
        return store.createRun(run);
    }
    void updateRun(const RunInfo& run)
    {
        store.updateRun(run);
    }
    bool getRun(long runId, RunInfo *run)
    {
        return store.getRun(runId, run);
    }
    std::vector<RunInfo> listRuns()
    {
        return store.listRuns();
    }
    void saveListing(long runId, const std::vector<Artifact>& artifacts)
    {
        store.saveListing(runId, artifacts);
    }
    std::vector<Artifact> getListing(long runId)
    {
        return store.getListing(runId);
    }
    bool getRecord(long runId, std::string identity, TransferRecord *record)
    {
        bool found = store.getRecord(runId, identity, record);
        std::unique_lock<std::mutex> lock(mtx);

        if (arrived < parties) {
            arrived++;
            cond.notify_all();
            cond.wait_for(lock, std::chrono::seconds(10),
                    [this] {return arrived >= parties;});
        }

        return found;
    }
    void putRecord(long runId, std::string identity,
            const TransferRecord& record,
            TransferRecord::state_t expectedPrior)
    {
        store.putRecord(runId, identity, record, expectedPrior);
    }
    std::set<std::string> listCommitted(long runId)
    {
        return store.listCommitted(runId);
    }
    std::map<std::string, TransferRecord> listRecords(long runId)
    {
        return store.listRecords(runId);
    }
    long requeueInProgress(long runId)
    {
        return store.requeueInProgress(runId);
    }
};
