#include "net/HttpFetcher.hpp"
#include "net/Url.hpp"
#include "core/BuildInfo.hpp"
#include <memory>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace upnpbridge::net {

namespace {

// One GET exchange. A watchdog timer bounds resolve + connect + write + read.
class FetchSession : public std::enable_shared_from_this<FetchSession> {
public:
    FetchSession(asio::io_context& ioc, IDescriptionFetcher::Handler handler)
    : resolver_(ioc), stream_(ioc), watchdog_(ioc), handler_(std::move(handler)) {}

    void run(const HttpUrl& url, std::chrono::steady_clock::duration timeout) {
        req_.version(11);
        req_.method(http::verb::get);
        req_.target(url.target);
        req_.set(http::field::host, url.host + ":" + url.port);
        req_.set(http::field::user_agent, buildinfo::product_token());
        req_.set(http::field::accept, "*/*");
        req_.keep_alive(false);

        auto self = shared_from_this();
        watchdog_.expires_after(timeout);
        watchdog_.async_wait([self](const boost::system::error_code& ec) {
            if (ec || self->done_) return;
            self->timed_out_ = true;
            self->resolver_.cancel();
            self->stream_.cancel();
        });

        resolver_.async_resolve(url.host, url.port,
            [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) return self->finish(ec);
                self->stream_.async_connect(results,
                    [self](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) return self->finish(ec);
                        self->on_connect();
                    });
            });
    }

private:
    void on_connect() {
        auto self = shared_from_this();
        http::async_write(stream_, req_, [self](const boost::system::error_code& ec, std::size_t) {
            if (ec) return self->finish(ec);
            http::async_read(self->stream_, self->buffer_, self->res_,
                [self](const boost::system::error_code& ec, std::size_t) {
                    self->finish(ec);
                });
        });
    }

    void finish(boost::system::error_code ec) {
        if (done_) return;
        done_ = true;
        watchdog_.cancel();
        if (timed_out_) ec = beast::error::timeout;

        FetchResult result;
        if (!ec) {
            result.status = res_.result_int();
            result.content_type = std::string(res_[http::field::content_type]);
            result.body = std::move(res_.body());
        }
        boost::system::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        handler_(ec, std::move(result));
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    asio::steady_timer watchdog_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    http::response<http::string_body> res_;
    IDescriptionFetcher::Handler handler_;
    bool done_ = false;
    bool timed_out_ = false;
};

} // namespace

HttpFetcher::HttpFetcher(asio::io_context& ioc) : ioc_(ioc) {}

void HttpFetcher::fetch(const std::string& url, std::chrono::steady_clock::duration timeout, Handler handler) {
    HttpUrl parsed;
    if (!parse_http_url(url, parsed)) {
        asio::post(ioc_, [handler = std::move(handler)]() {
            handler(asio::error::invalid_argument, FetchResult{});
        });
        return;
    }
    std::make_shared<FetchSession>(ioc_, std::move(handler))->run(parsed, timeout);
}

} // namespace upnpbridge::net
