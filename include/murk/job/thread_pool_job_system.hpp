#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: thread_pool_job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Тогтмол тооны worker thread-тэй FIFO ажлын дараалал.
*/


#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "murk/job/job_system.hpp"

namespace murk
{
    // 0 гэж өгвөл hardware_concurrency-г ашиглана.
    inline size_t resolve_worker_count(size_t requested)
    {
        if (requested != 0) return requested;
        const unsigned hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : (size_t)hw;
    }

    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count = 0)
        {
            const size_t n = resolve_worker_count(worker_count);
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                workers_.emplace_back([this]() { worker_loop(); });
            }
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stop_ = true;
            }
            work_cv_.notify_all();
            for (auto& w : workers_)
            {
                if (w.joinable()) w.join();
            }
        }

        void enqueue(std::function<void()> job) override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
            }
            work_cv_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> lock(mtx_);
            idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
        }

        size_t worker_count() const override
        {
            return workers_.size();
        }

    private:
        void worker_loop()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            for (;;)
            {
                work_cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
                if (queue_.empty()) return; // stop_ тавигдсан, дараалал хоосон.

                std::function<void()> job = std::move(queue_.front());
                queue_.pop_front();
                ++running_;

                lock.unlock();
                job();
                lock.lock();

                --running_;
                if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> workers_{};
        std::deque<std::function<void()>> queue_{};
        std::mutex mtx_{};
        std::condition_variable work_cv_{};
        std::condition_variable idle_cv_{};
        size_t running_ = 0;
        bool stop_ = false;
    };
}
