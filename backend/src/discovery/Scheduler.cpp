#include "discovery/Scheduler.hpp"
#include <iostream>

namespace asio = boost::asio;

namespace upnpbridge {

SchedulerConfig SchedulerConfig::from(const ProxyConfig& cfg) {
    SchedulerConfig out;
    out.announce_interval = cfg.announce_interval;
    out.discovery_initial_delay = cfg.discovery_initial_delay;
    out.discovery_interval = cfg.discovery_interval;
    out.discovery_max_wait = cfg.discovery_max_wait;
    out.cleanup_interval = cfg.cleanup_interval;
    out.stale_age = cfg.stale_age;
    out.cache_max_size = cfg.cache_max_size;
    out.cache_keep = cfg.cache_keep;
    return out;
}

Scheduler::Scheduler(asio::io_context& ioc, IDiscoveryTransport& transport, DeviceRegistry& registry,
                     ConversionCache& cache, SchedulerConfig cfg, NowFn now)
: transport_(transport), registry_(registry), cache_(cache), cfg_(cfg), now_(std::move(now)),
  announce_(ioc), discovery_(ioc), cleanup_(ioc) {
    if (!now_) now_ = [] { return Clock::now(); };
}

Scheduler::~Scheduler() {
    cancel_all();
}

void Scheduler::start() {
    start_announce();
    start_discovery();
    start_cleanup();
}

void Scheduler::cancel_all() {
    cancel(announce_);
    cancel(discovery_);
    cancel(cleanup_);
}

void Scheduler::start_announce() {
    if (announce_.active) return;
    announce_.active = true;
    ++announce_.generation;
    announce_tick();
    arm(announce_, cfg_.announce_interval, cfg_.announce_interval, &Scheduler::announce_tick);
}

void Scheduler::start_discovery() {
    if (discovery_.active) return;
    discovery_.active = true;
    ++discovery_.generation;
    // give the listener time to come up before the first probe
    arm(discovery_, cfg_.discovery_initial_delay, cfg_.discovery_interval, &Scheduler::discovery_tick);
}

void Scheduler::start_cleanup() {
    if (cleanup_.active) return;
    cleanup_.active = true;
    ++cleanup_.generation;
    arm(cleanup_, cfg_.cleanup_interval, cfg_.cleanup_interval, &Scheduler::run_cleanup);
}

void Scheduler::cancel_announce() { cancel(announce_); }
void Scheduler::cancel_discovery() { cancel(discovery_); }
void Scheduler::cancel_cleanup() { cancel(cleanup_); }

void Scheduler::cancel(Loop& loop) {
    if (!loop.active) return;
    loop.active = false;
    ++loop.generation;
    loop.timer.cancel();
}

void Scheduler::arm(Loop& loop, SchedulerConfig::Duration delay, SchedulerConfig::Duration interval, Tick tick) {
    loop.timer.expires_after(delay);
    loop.timer.async_wait([this, &loop, gen = loop.generation, interval, tick](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        // a wait that completed just before cancel() still belongs to the old generation
        if (!loop.active || gen != loop.generation) return;
        if (ec) {
            std::cerr << "Scheduler: timer error: " << ec.message() << std::endl;
            loop.active = false;
            return;
        }
        try {
            (this->*tick)();
        } catch (const std::exception& e) {
            std::cerr << "Scheduler: loop iteration failed: " << e.what() << std::endl;
        }
        arm(loop, interval, interval, tick);
    });
}

void Scheduler::announce_tick() {
    transport_.send_alive();
}

void Scheduler::discovery_tick() {
    transport_.send_search(ssdp::SEARCH_ALL, cfg_.discovery_max_wait);
}

void Scheduler::run_cleanup() {
    auto removed = registry_.sweep(now_(), cfg_.stale_age);
    for (const auto& uuid : removed) {
        std::cout << "Removing stale device: " << uuid << std::endl;
    }
    auto evicted = cache_.compact(cfg_.cache_max_size, cfg_.cache_keep);
    if (evicted > 0) {
        std::cout << "Scheduler: evicted " << evicted << " cached conversions" << std::endl;
    }
}

} // namespace upnpbridge
