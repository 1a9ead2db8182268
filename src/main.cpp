// Entry point for the orbit view
//
// Usage: orbit_view [scenario.json] [--frames N] [--fps F] [--log-level debug|info|warn|error]
//                   [--log-file] [--save-default PATH]
//
// Without a scenario file the built-in Sun/Earth/Mars system is used. The loop runs
// until Ctrl+C or until N frames have been rendered.

#include "core/config.h"
#include "core/util/logger.h"
#include "game/orbit_app.h"
#include "game/scenario_loader.h"
#include "runtime/frame_host.h"
#include "runtime/info_metrics.h"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace
{
    std::atomic<bool> g_stop_requested{false};

    extern "C" void handle_interrupt(int)
    {
        g_stop_requested.store(true, std::memory_order_relaxed);
    }

    struct CommandLine
    {
        std::string scenario_path;
        std::string save_default_path;
        uint64_t max_frames{0};
        double target_fps{kDefaultTargetFps};
        LogLevel log_level{LogLevel::Info};
        bool log_to_file{false};
    };

    void print_usage()
    {
        fmt::print(stderr,
                   "usage: orbit_view [scenario.json] [--frames N] [--fps F] "
                   "[--log-level debug|info|warn|error] [--log-file] [--save-default PATH]\n");
    }

    std::optional<CommandLine> parse_command_line(int argc, char *argv[])
    {
        CommandLine cl{};
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            const bool has_value = i + 1 < argc;

            try
            {
                if (arg == "--frames" && has_value)
                {
                    cl.max_frames = std::stoull(argv[++i]);
                }
                else if (arg == "--fps" && has_value)
                {
                    cl.target_fps = std::stod(argv[++i]);
                }
                else if (arg == "--log-level" && has_value)
                {
                    auto level = parse_log_level(argv[++i]);
                    if (!level)
                    {
                        fmt::print(stderr, "unknown log level '{}'\n", argv[i]);
                        return std::nullopt;
                    }
                    cl.log_level = *level;
                }
                else if (arg == "--log-file")
                {
                    cl.log_to_file = true;
                }
                else if (arg == "--save-default" && has_value)
                {
                    cl.save_default_path = argv[++i];
                }
                else if (!arg.empty() && arg.front() != '-' && cl.scenario_path.empty())
                {
                    cl.scenario_path = std::string(arg);
                }
                else
                {
                    fmt::print(stderr, "unexpected argument '{}'\n", arg);
                    return std::nullopt;
                }
            }
            catch (const std::exception &)
            {
                fmt::print(stderr, "invalid value for '{}'\n", arg);
                return std::nullopt;
            }
        }
        return cl;
    }
} // namespace

int main(int argc, char *argv[])
{
    const std::optional<CommandLine> cl = parse_command_line(argc, argv);
    if (!cl)
    {
        print_usage();
        return EXIT_FAILURE;
    }

    Logger::init(cl->log_to_file ? LogOutput::Both : LogOutput::Console, cl->log_level);

    if (!cl->save_default_path.empty())
    {
        const bool saved = OrbitView::save_scenario_config(cl->save_default_path, OrbitView::default_solar_config());
        Logger::shutdown();
        return saved ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    OrbitView::ScenarioConfig config = OrbitView::default_solar_config();
    if (!cl->scenario_path.empty())
    {
        auto loaded = OrbitView::load_scenario_config(cl->scenario_path);
        if (!loaded)
        {
            Logger::shutdown();
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    std::signal(SIGINT, handle_interrupt);

    int exit_code = EXIT_SUCCESS;
    try
    {
        OrbitView::OrbitApp app(config);

        OrbitView::FixedRateFrameHost::Config host_cfg{};
        host_cfg.target_fps = cl->target_fps;
        host_cfg.max_frames = cl->max_frames;
        host_cfg.external_stop = &g_stop_requested;
        OrbitView::FixedRateFrameHost host(host_cfg);

        app.run(host);

        const auto &clock = app.loop().simulation_clock();
        Logger::info("Finished: {} frames, {} physics steps, {} simulated days",
                     app.loop().frame_count(), clock.physics_steps(),
                     OrbitView::format_elapsed_days(clock.simulation_time() / kSecondsPerDay));
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    Logger::shutdown();
    return exit_code;
}
