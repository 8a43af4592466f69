#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Shader stage-уудыг мөр мөрөөр нь зэрэгцээ ажиллуулах ажлын системийн
            интерфэйс, хүлээлтийн бүлэг ба parallel_for_1d туслах функц.
*/


#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace murk
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t worker_count() const = 0;
    };

    // Enqueue хийсэн багц ажлуудын дуусахыг хүлээнэ.
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            pending_.fetch_add(n, std::memory_order_relaxed);
        }

        void done()
        {
            // wait() буцаж WaitGroup устахаас өмнө lock-ийн дор тоолуурыг бууруулна.
            std::lock_guard<std::mutex> lock(mtx_);
            if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&]() { return pending_.load(std::memory_order_acquire) == 0; });
        }

    private:
        std::atomic<int> pending_{0};
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };

    /*
        [begin, end) мужийг хэсэгчлэн fn(b, e)-г дуудна. Job system байхгүй эсвэл
        мөрийн тоо min_grain-аас бага бол дуудагч thread дээр шууд ажиллана.
        Буцах үед бүх хэсэг дууссан байна.
    */
    template<typename Fn>
    inline void parallel_for_1d(
        IJobSystem* js,
        int begin,
        int end,
        int min_grain,
        Fn&& fn
    )
    {
        if (end <= begin) return;
        const int count = end - begin;
        const int grain = std::max(1, min_grain);
        if (!js || js->worker_count() <= 1 || count <= grain)
        {
            fn(begin, end);
            return;
        }

        const int workers = (int)js->worker_count();
        const int chunks = std::max(1, std::min(workers * 2, (count + grain - 1) / grain));
        const int chunk_rows = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        for (int b = begin; b < end; b += chunk_rows)
        {
            const int e = std::min(end, b + chunk_rows);
            wg.add(1);
            js->enqueue([b, e, &fn, &wg]() {
                fn(b, e);
                wg.done();
            });
        }
        wg.wait();
    }
}
