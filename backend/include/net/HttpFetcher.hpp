#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace upnpbridge::net {

struct FetchResult {
    unsigned status = 0;
    std::string content_type;
    std::string body;
};

/**
 * @brief Asynchronous GET of a remote description document.
 *
 * The handler runs exactly once on the io thread. A fetch that exceeds its
 * timeout completes with boost::beast::error::timeout.
 */
class IDescriptionFetcher {
public:
    using Handler = std::function<void(boost::system::error_code, FetchResult)>;

    virtual ~IDescriptionFetcher() = default;
    virtual void fetch(const std::string& url, std::chrono::steady_clock::duration timeout, Handler handler) = 0;
};

// Boost.Beast HTTP/1.1 client, plain http:// only.
class HttpFetcher : public IDescriptionFetcher {
public:
    explicit HttpFetcher(boost::asio::io_context& ioc);

    void fetch(const std::string& url, std::chrono::steady_clock::duration timeout, Handler handler) override;

private:
    boost::asio::io_context& ioc_;
};

} // namespace upnpbridge::net
