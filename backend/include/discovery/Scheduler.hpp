#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "DeviceRegistry.hpp"
#include "core/ConversionCache.hpp"
#include "core/ProxyConfig.hpp"
#include "discovery/IDiscoveryTransport.hpp"

namespace upnpbridge {

struct SchedulerConfig {
    using Duration = Clock::duration;

    Duration announce_interval = std::chrono::seconds(600);
    Duration discovery_initial_delay = std::chrono::seconds(5);
    Duration discovery_interval = std::chrono::seconds(120);
    int discovery_max_wait = 3;
    Duration cleanup_interval = std::chrono::seconds(300);
    Duration stale_age = std::chrono::seconds(3600);
    std::size_t cache_max_size = 100;
    std::size_t cache_keep = 50;

    static SchedulerConfig from(const ProxyConfig& cfg);
};

/**
 * @brief Time-driven behaviour of the proxy: three independent timer loops.
 *
 *  - announce: ssdp:alive now, then every announce_interval
 *  - discovery: after discovery_initial_delay, M-SEARCH ssdp:all every discovery_interval
 *  - cleanup: every cleanup_interval, sweep stale devices and compact the cache
 *
 * Each loop can be cancelled on its own; a cancelled wait ends the loop quietly.
 */
class Scheduler {
public:
    using NowFn = std::function<Clock::time_point()>;

    Scheduler(boost::asio::io_context& ioc, IDiscoveryTransport& transport, DeviceRegistry& registry,
              ConversionCache& cache, SchedulerConfig cfg, NowFn now = {});
    ~Scheduler();

    void start();
    void cancel_all();

    void start_announce();
    void start_discovery();
    void start_cleanup();
    void cancel_announce();
    void cancel_discovery();
    void cancel_cleanup();

    bool announce_active() const { return announce_.active; }
    bool discovery_active() const { return discovery_.active; }
    bool cleanup_active() const { return cleanup_.active; }

    // One cleanup pass, also used by the cleanup loop.
    void run_cleanup();

private:
    struct Loop {
        explicit Loop(boost::asio::io_context& ioc) : timer(ioc) {}
        boost::asio::steady_timer timer;
        unsigned generation = 0;
        bool active = false;
    };
    using Tick = void (Scheduler::*)();

    void arm(Loop& loop, SchedulerConfig::Duration delay, SchedulerConfig::Duration interval, Tick tick);
    void cancel(Loop& loop);
    void announce_tick();
    void discovery_tick();

    IDiscoveryTransport& transport_;
    DeviceRegistry& registry_;
    ConversionCache& cache_;
    SchedulerConfig cfg_;
    NowFn now_;

    Loop announce_;
    Loop discovery_;
    Loop cleanup_;
};

} // namespace upnpbridge
