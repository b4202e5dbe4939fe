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

/** @page thread_pool Thread pool

    ThreadPool is a fixed set of threads executing a single function
    with different arguments. Each call of enqueue() adds a job for a
    given request number. The call blocks as long as all threads are
    busy such that a thread executes a job completely before another
    job is accepted. waitCompletion() waits until all jobs of a request
    number have been finished.
 */

template<typename ... Args> class ThreadPool
{
private:
    std::mutex enqueue_mtx;

    std::mutex mtx;
    std::condition_variable cond_add;
    std::condition_variable cond_cont;
    std::condition_variable cond_fin;

    struct job_t
    {
        int reqNum;
        std::function<void()> task;
    };

    std::deque<job_t> jobs;
    std::map<int, long> numJobs;
    bool terminated;
    int occupied;

    const std::function<void(Args ... args)> func;
    int num_thrds;
    std::vector<std::thread> threads;
    std::string name;

    void threadfunc(int i)
    {
        job_t job;
        std::stringstream tname;

        tname << name << ":" << std::setfill('0') << std::setw(2) << i;
        pthread_setname_np(pthread_self(), tname.str().substr(0, 15).c_str());

        std::unique_lock<std::mutex> lock(mtx);

        while (true) {
            cond_add.wait(lock, [this] {return terminated || jobs.size() > 0;});
            if (jobs.size() == 0)
                return;

            job = std::move(jobs.front());
            jobs.pop_front();
            occupied++;

            lock.unlock();

            try {
                job.task();
            } catch (const std::exception& e) {
                TRACE(Trace::error, name, job.reqNum, e.what());
                MSG(PKGMIGE0010E, name, e.what());
            }
            job.task = nullptr;

            lock.lock();

            occupied--;
            if (--numJobs[job.reqNum] == 0)
                cond_fin.notify_all();
            cond_cont.notify_one();
        }
    }

public:
    ThreadPool(std::function<void(Args ... args)> func_, int num_thrds_,
            std::string name_) :
            terminated(false), occupied(0), func(func_), num_thrds(
                    num_thrds_ > 0 ? num_thrds_ : 1), name(name_)
    {
        for (int i = 0; i < num_thrds; i++)
            threads.push_back(std::thread(&ThreadPool::threadfunc, this, i));
    }

    ~ThreadPool()
    {
        terminate();
    }

    void enqueue(int reqNum, Args ... args)
    {
        std::lock_guard<std::mutex> elock(enqueue_mtx);
        std::unique_lock<std::mutex> lock(mtx);

        cond_cont.wait(lock,
                [this] {return terminated || occupied + (int) jobs.size() < num_thrds;});

        if (terminated)
            THROW(Error::TERMINATING, name);

        numJobs[reqNum]++;
        jobs.push_back( { reqNum, std::bind(func, args ...) });
        cond_add.notify_one();
    }

    void waitCompletion(int reqNum)
    {
        std::unique_lock<std::mutex> lock(mtx);

        cond_fin.wait(lock, [this, reqNum] {return numJobs[reqNum] == 0;});
        numJobs.erase(reqNum);
    }

    int getNumThreads()
    {
        return num_thrds;
    }

    void terminate()
    {
        std::unique_lock<std::mutex> lock(mtx);

        terminated = true;
        cond_add.notify_all();
        cond_cont.notify_all();
        lock.unlock();

        for (std::thread& thrd : threads)
            if (thrd.joinable())
                thrd.join();
        threads.clear();
    }
};
