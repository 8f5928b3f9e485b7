#include "ProxyService.hpp"
#include "core/BuildInfo.hpp"
#include "core/ProxyConfig.hpp"
#include <iostream>
#include <csignal>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

int main(int argc, char** argv) {
    auto parsed = upnpbridge::parse_config(argc, argv);
    if (parsed.show_help) {
        upnpbridge::print_usage(argv[0]);
        return 0;
    }

    std::cout << upnpbridge::buildinfo::product_token()
              << " (" << upnpbridge::buildinfo::git_commit() << ")" << std::endl;

    boost::asio::io_context ioc;
    upnpbridge::ProxyService service(ioc, parsed.config);

    try {
        service.start();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    // CTRL-C / SIGTERM: byebye, close sockets, let run() drain
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cout << "Received signal " << signo << ", shutting down..." << std::endl;
        service.stop();
    });

    try {
        ioc.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
