#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: context.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Pass-уудын хооронд дамжих ажлын систем, фрэймийн дугаар ба
            гүйцэтгэлийн статистик.
*/


#include <chrono>
#include <cstdint>

#include "murk/job/job_system.hpp"

namespace murk
{
    // Фрэйм бүрийн гурвалжны тоо ба pass тус бүрийн зарцуулсан хугацаа (ms).
    struct RenderDebugStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t fragments_shaded = 0;
        float ms_shadow = 0.0f;
        float ms_pbr = 0.0f;
        float ms_light_gizmo = 0.0f;
        float ms_fog = 0.0f;
        float ms_resolve = 0.0f;

        void reset()
        {
            *this = RenderDebugStats{};
        }

        float ms_total() const
        {
            return ms_shadow + ms_pbr + ms_light_gizmo + ms_fog + ms_resolve;
        }
    };

    struct Context
    {
        IJobSystem* job_system = nullptr;
        uint64_t frame_index = 0;
        RenderDebugStats debug{};
    };

    // Scope дуусахад өнгөрсөн хугацааг out руу нэмнэ.
    class ScopedPassTimer
    {
    public:
        explicit ScopedPassTimer(float& out)
            : out_(out), t0_(std::chrono::steady_clock::now())
        {}

        ~ScopedPassTimer()
        {
            const auto t1 = std::chrono::steady_clock::now();
            out_ += std::chrono::duration<float, std::milli>(t1 - t0_).count();
        }

        ScopedPassTimer(const ScopedPassTimer&) = delete;
        ScopedPassTimer& operator=(const ScopedPassTimer&) = delete;

    private:
        float& out_;
        std::chrono::steady_clock::time_point t0_;
    };
}
