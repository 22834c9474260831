#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: thread_pool_job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Тогтмол тооны worker-тэй, FIFO queue-тэй IJobSystem.
*/


#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "shc/job/job_system.hpp"

namespace shc
{
    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count)
        {
            const size_t n = std::max<size_t>(1, worker_count);
            threads_.reserve(n);
            for (size_t i = 0; i < n; ++i) threads_.emplace_back(&ThreadPoolJobSystem::run_worker, this);
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        // Queue-д үлдсэн job-уудыг дуусгаад worker-уудыг зогсооно.
        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                shutting_down_ = true;
            }
            work_cv_.notify_all();
            for (std::thread& t : threads_) t.join();
        }

        void enqueue(std::function<void()> job) override
        {
            if (!job) return;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
                ++pending_;
            }
            work_cv_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> lock(mtx_);
            idle_cv_.wait(lock, [this]() { return pending_ == 0; });
        }

        size_t worker_count() const override { return threads_.size(); }

        uint64_t jobs_completed() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return completed_;
        }

    private:
        void run_worker()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            for (;;)
            {
                work_cv_.wait(lock, [this]() { return shutting_down_ || !queue_.empty(); });
                if (queue_.empty()) return;

                std::function<void()> job = std::move(queue_.front());
                queue_.pop_front();
                lock.unlock();
                job();
                lock.lock();

                ++completed_;
                if (--pending_ == 0) idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> threads_{};
        std::deque<std::function<void()>> queue_{};
        mutable std::mutex mtx_{};
        std::condition_variable work_cv_{};
        std::condition_variable idle_cv_{};
        size_t pending_ = 0;
        uint64_t completed_ = 0;
        bool shutting_down_ = false;
    };
}
