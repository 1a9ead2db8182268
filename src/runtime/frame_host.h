#pragma once

// IFrameHost: the scheduler that calls the per-frame callback.
// Runs until request_stop() is called (from inside a frame or by its owner).

#include <core/config.h>

#include <atomic>
#include <cstdint>
#include <functional>

namespace OrbitView
{
    class IFrameHost
    {
    public:
        using FrameFn = std::function<void()>;

        virtual ~IFrameHost() = default;

        // Blocks, invoking `frame` once per display refresh until stopped.
        virtual void run(const FrameFn &frame) = 0;

        virtual void request_stop() = 0;
        virtual bool stop_requested() const = 0;
    };

    // Paces frames to a target rate on the calling thread.
    class FixedRateFrameHost : public IFrameHost
    {
    public:
        struct Config
        {
            double target_fps{kDefaultTargetFps}; // <= 0 runs uncapped
            uint64_t max_frames{0};               // per run(); 0 = until stopped
            const std::atomic<bool> *external_stop{nullptr}; // e.g. set from a signal handler
        };

        FixedRateFrameHost();
        explicit FixedRateFrameHost(const Config &config);

        void run(const FrameFn &frame) override;

        void request_stop() override { _stop_requested = true; }
        bool stop_requested() const override { return _stop_requested; }

        // Frames invoked by the most recent run().
        uint64_t frames_run() const { return _frames_run; }

    private:
        Config _config{};
        bool _stop_requested{false};
        uint64_t _frames_run{0};
    };
} // namespace OrbitView
