#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of workers that run indexed batches. run(n, job) hands out the
// indices 0 .. n-1 one at a time to whichever worker is free, so uneven
// jobs (tiles inside vs. outside the set) balance themselves.
// One batch at a time; run() is not reentrant.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(static_cast<size_t>(n_threads));
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_batch.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int size() const { return static_cast<int>(workers.size()); }

    // Runs job(0) .. job(job_count - 1) on the workers and blocks until all
    // of them have returned.
    void run(int job_count, const std::function<void(int)>& job)
    {
        if (job_count <= 0) return;

        std::unique_lock<std::mutex> lock(mtx);
        batch_job  = &job;
        batch_size = job_count;
        next_index = 0;
        unfinished = job_count;
        ++generation;
        cv_batch.notify_all();
        cv_done.wait(lock, [this] { return unfinished == 0; });
        batch_job = nullptr;
    }

private:
    void worker_loop()
    {
        uint64_t seen = 0;
        std::unique_lock<std::mutex> lock(mtx);
        while (true) {
            cv_batch.wait(lock, [&] { return stopping || generation != seen; });
            if (stopping) return;
            seen = generation;

            while (next_index < batch_size) {
                const int index = next_index++;
                const std::function<void(int)>* job = batch_job;
                lock.unlock();
                (*job)(index);
                lock.lock();
                if (--unfinished == 0) cv_done.notify_one();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::mutex                        mtx;
    std::condition_variable           cv_batch;
    std::condition_variable           cv_done;
    const std::function<void(int)>*   batch_job  = nullptr;
    int                               batch_size = 0;
    int                               next_index = 0;
    int                               unfinished = 0;
    uint64_t                          generation = 0;
    bool                              stopping   = false;
};
