#include "app/DaemonMain.hpp"
#include "app/ReplayTransport.hpp"
#include "engine/Core.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/RetryPolicy.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace
{

struct DaemonOptions
{
    std::filesystem::path state_path;
    std::filesystem::path replay_path;
    std::string log_path;
    int run_seconds = 0;
};

std::optional<int> parse_seconds(std::string_view text)
{
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0)
    {
        return std::nullopt;
    }
    return value;
}

// Accepts both "--flag value" and "--flag=value".
std::optional<DaemonOptions> parse_arguments(int argc, char *argv[])
{
    DaemonOptions options;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
            continue;
        std::string arg = argv[index];
        std::string value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
        {
            value = arg.substr(eq + 1);
            arg.resize(eq);
        }
        else if (index + 1 < argc && argv[index + 1] != nullptr &&
                 argv[index + 1][0] != '-')
        {
            value = argv[++index];
        }

        if (arg == "--state")
        {
            options.state_path = value;
        }
        else if (arg == "--replay")
        {
            options.replay_path = value;
        }
        else if (arg == "--log")
        {
            options.log_path = value;
        }
        else if (arg == "--run-seconds")
        {
            auto seconds = value.empty() ? std::optional<int>(5)
                                         : parse_seconds(value);
            if (!seconds)
            {
                std::fprintf(stderr, "invalid --run-seconds value '%s'\n",
                             value.c_str());
                return std::nullopt;
            }
            options.run_seconds = *seconds;
        }
        else
        {
            std::fprintf(stderr, "unknown argument '%s'\n", arg.c_str());
            return std::nullopt;
        }
        if ((arg == "--state" || arg == "--replay" || arg == "--log") &&
            value.empty())
        {
            std::fprintf(stderr, "%s requires a path\n", arg.c_str());
            return std::nullopt;
        }
    }
    return options;
}

void print_usage()
{
    mp::log::print_status(
        "usage: meshpresenced [--state <db>] [--replay <file.json>] "
        "[--log <file>] [--run-seconds <n>]");
}

} // namespace

namespace mp::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        mp::runtime::install_signal_handlers();

        auto options = parse_arguments(argc, argv);
        if (!options)
        {
            print_usage();
            return 2;
        }
        if (!options->log_path.empty())
        {
            mp::log::set_log_file(options->log_path);
        }

        std::unique_ptr<ReplayTransport> transport;
        if (!options->replay_path.empty())
        {
            transport = ReplayTransport::load(options->replay_path);
        }
        else
        {
            // Nothing to replay: an idle but ready transport.
            transport = ReplayTransport::parse(R"({"status":"ready"})");
        }
        if (!transport)
        {
            mp::log::print_status("meshpresenced: unable to load replay {}",
                                  options->replay_path.string());
            return 1;
        }

        MP_LOG_INFO("meshpresenced {} starting", MP_VERSION);

        mp::engine::PresenceSettings settings;
        settings.state_path = options->state_path;
        auto engine = mp::engine::Core::create(settings, *transport);
        MP_LOG_INFO("state database: {}",
                    settings.state_path.empty()
                        ? (mp::utils::data_root() / "meshpresence.db").string()
                        : settings.state_path.string());

        engine->reachable_count().subscribe(
            [](int count) { MP_LOG_INFO("reachable peers: {}", count); });
        engine->markers().subscribe(
            [](std::vector<mp::engine::ContactMarker> const &markers)
            {
                for (auto const &marker : markers)
                {
                    MP_LOG_DEBUG("marker {} ({}) {}", marker.display_name,
                                 mp::engine::truncated_id(marker.peer_id),
                                 mp::engine::to_string(marker.freshness));
                }
            });

        std::thread engine_thread([core = engine.get()] { core->run(); });
        MP_LOG_INFO("Engine thread started");

        if (transport->announce_count() > 0)
        {
            // Replay once the pipeline has subscribed.
            bool subscribed = mp::engine::retry_with_policy(
                mp::engine::RetryPolicy::fixed(
                    50, std::chrono::milliseconds(100)),
                "replay subscription",
                [&] { return transport->subscriber_count() > 0; });
            if (subscribed)
            {
                auto emitted = transport->emit_all();
                engine->flush_ingestion();
                auto stats = engine->ingestion_statistics();
                MP_LOG_INFO("replayed {} announce(s): {} ingested, {} "
                            "malformed, {} failed",
                            emitted, stats.ingested, stats.dropped_malformed,
                            stats.failed_persist);
            }
        }

        if (options->run_seconds > 0)
        {
            std::thread(
                [seconds = options->run_seconds]()
                {
                    std::this_thread::sleep_for(std::chrono::seconds(seconds));
                    MP_LOG_INFO("Auto shutdown: run-seconds={} reached, "
                                "requesting shutdown",
                                seconds);
                    mp::runtime::request_shutdown();
                })
                .detach();
        }

        mp::log::print_status("meshpresenced running; CTRL+C to stop.");

        while (!mp::runtime::should_shutdown())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        MP_LOG_INFO("Shutdown requested; stopping engine...");
        engine->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        // Drains the workers and flushes settings.
        engine.reset();

        mp::log::print_status("Shutdown complete.");
        MP_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "meshpresenced failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace mp::app

int main(int argc, char *argv[])
{
    return mp::app::daemon_main(argc, argv);
}
