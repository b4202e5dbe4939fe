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

class Cancellation
{
private:
    std::mutex mtx;
    std::condition_variable cond;
    bool cancelled;
public:
    Cancellation() :
            cancelled(false)
    {
    }

    void cancel()
    {
        std::lock_guard<std::mutex> lock(mtx);

        cancelled = true;
        cond.notify_all();
    }

    bool isCancelled()
    {
        std::lock_guard<std::mutex> lock(mtx);

        return cancelled;
    }

    // returns false if cancelled before the duration elapsed
    bool sleep(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(mtx);

        return !cond.wait_for(lock, duration, [this] {return cancelled;});
    }
};
