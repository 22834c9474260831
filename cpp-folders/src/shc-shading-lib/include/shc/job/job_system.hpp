#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Vertex/fragment invocation-уудыг зэрэг ажиллуулах job system-ийн интерфэйс
            болон тэдгээрийг хүлээх WaitGroup.
*/


#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace shc
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t worker_count() const = 0;
    };

    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            count_.fetch_add(n, std::memory_order_relaxed);
        }

        // Decrement нь mtx_ дор явагдана: wait() буцсаны дараа done() WaitGroup-д хандахгүй.
        void done()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (count_.fetch_sub(1, std::memory_order_acq_rel) == 1) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&]() { return count_.load(std::memory_order_acquire) == 0; });
        }

    private:
        std::atomic<int> count_{0};
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };
}
