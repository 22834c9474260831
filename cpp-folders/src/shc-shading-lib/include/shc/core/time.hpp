#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Кадр хоорондын dt болон FPS-ийн гулсах дундажийг тооцно.
*/


#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace shc
{
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;

        float begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0)
            {
                ticks_prev = ticks_now;
                return 0.0f;
            }
            const float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            return dt;
        }
    };

    constexpr size_t SHC_FRAME_HISTORY = 128;
    constexpr size_t SHC_FRAME_RATE_HISTORY = 128;

    class FrameRateTracker
    {
    public:
        explicit FrameRateTracker(size_t frame_history = SHC_FRAME_HISTORY, size_t rate_history = SHC_FRAME_RATE_HISTORY)
            : frame_history_(frame_history == 0 ? 1 : frame_history),
              rate_history_(rate_history == 0 ? 1 : rate_history)
        {}

        // Дууссан кадрын үргэлжлэх хугацааг (секунд) бүртгэнэ.
        void push_frame(float frame_time_s)
        {
            frame_times_.push_back(frame_time_s);
            if (frame_times_.size() > frame_history_) frame_times_.pop_front();

            rates_.push_back(frame_rate());
            if (rates_.size() > rate_history_) rates_.pop_front();
        }

        // Хадгалсан кадрын тоо / нийт хугацаа. Нийлбэрийг 0.01s нарийвчлалтай бөөрөнхийлнө.
        float frame_rate() const
        {
            if (frame_times_.empty()) return 0.0f;
            float sum = 0.0f;
            for (float t : frame_times_) sum += t;
            const float rounded = std::round(sum * 100.0f) / 100.0f;
            if (rounded <= 0.0f) return 0.0f;
            return (float)frame_times_.size() / rounded;
        }

        float average_frame_rate() const
        {
            if (rates_.empty()) return 0.0f;
            float sum = 0.0f;
            for (float r : rates_) sum += r;
            return sum / (float)rates_.size();
        }

        size_t frame_count() const { return frame_times_.size(); }
        size_t rate_count() const { return rates_.size(); }

    private:
        size_t frame_history_ = SHC_FRAME_HISTORY;
        size_t rate_history_ = SHC_FRAME_RATE_HISTORY;
        std::deque<float> frame_times_{};
        std::deque<float> rates_{};
    };
}
