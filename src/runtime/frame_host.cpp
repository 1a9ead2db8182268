#include "frame_host.h"
#include "core/util/logger.h"

#include <chrono>
#include <thread>

namespace OrbitView
{
    FixedRateFrameHost::FixedRateFrameHost()
        : FixedRateFrameHost(Config{})
    {
    }

    FixedRateFrameHost::FixedRateFrameHost(const Config &config)
        : _config(config)
    {
    }

    void FixedRateFrameHost::run(const FrameFn &frame)
    {
        if (!frame)
        {
            return;
        }

        using clock = std::chrono::steady_clock;

        const bool capped = _config.target_fps > 0.0;
        const auto frame_budget = capped
                                      ? std::chrono::duration_cast<clock::duration>(
                                              std::chrono::duration<double>(1.0 / _config.target_fps))
                                      : clock::duration::zero();

        _stop_requested = false;
        _frames_run = 0;
        Logger::debug("[FrameHost] running at {} fps, frame limit {}",
                      capped ? _config.target_fps : 0.0, _config.max_frames);

        while (!_stop_requested)
        {
            const auto frame_start = clock::now();

            frame();
            ++_frames_run;

            if (_config.max_frames > 0 && _frames_run >= _config.max_frames)
            {
                _stop_requested = true;
            }
            if (_config.external_stop && _config.external_stop->load(std::memory_order_relaxed))
            {
                _stop_requested = true;
            }

            // --- Cap frame rate --- //
            if (capped && !_stop_requested)
            {
                const auto work_time = clock::now() - frame_start;
                if (work_time < frame_budget)
                {
                    std::this_thread::sleep_for(frame_budget - work_time);
                }
            }
        }

        Logger::debug("[FrameHost] stopped after {} frames", _frames_run);
    }
} // namespace OrbitView
