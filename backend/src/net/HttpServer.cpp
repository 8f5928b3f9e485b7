#include "net/HttpServer.hpp"
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace upnpbridge::net {

namespace {

constexpr std::chrono::seconds READ_TIMEOUT{30};
constexpr std::chrono::seconds WRITE_TIMEOUT{30};

} // namespace

namespace detail {
class HttpSession;
}
using detail::HttpSession;

struct HttpServer::SessionSet {
    std::mutex m;
    std::set<std::shared_ptr<HttpSession>> sessions;

    void add(const std::shared_ptr<HttpSession>& s) {
        std::lock_guard<std::mutex> lk(m);
        sessions.insert(s);
    }
    void remove(const std::shared_ptr<HttpSession>& s) {
        std::lock_guard<std::mutex> lk(m);
        sessions.erase(s);
    }
    std::set<std::shared_ptr<HttpSession>> snapshot() {
        std::lock_guard<std::mutex> lk(m);
        return sessions;
    }
};

namespace detail {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, HttpServer::RequestHandler handler, std::shared_ptr<HttpServer::SessionSet> set)
    : stream_(std::move(socket)), handler_(std::move(handler)), set_(std::move(set)) {}

    void start() {
        set_->add(shared_from_this());
        do_read();
    }

    void close() {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
        set_->remove(shared_from_this());
    }

private:
    void do_read() {
        req_ = {};
        stream_.expires_after(READ_TIMEOUT);
        auto self = shared_from_this();
        http::async_read(stream_, buffer_, req_, [self](const boost::system::error_code& ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(const boost::system::error_code& ec) {
        if (ec == http::error::end_of_stream) return close();
        if (ec) {
            if (ec != asio::error::operation_aborted && ec != beast::error::timeout) {
                std::cerr << "HttpServer: read failed: " << ec.message() << std::endl;
            }
            return close();
        }

        auto self = shared_from_this();
        try {
            handler_(req_, [self](ProxyApi::Response res) { self->send(std::move(res)); });
        } catch (const std::exception& e) {
            std::cerr << "HttpServer: handler error: " << e.what() << std::endl;
            send(ProxyApi::make_json_response(500, {{"error", e.what()}}, req_.version(), false));
        }
    }

    void send(ProxyApi::Response res) {
        auto msg = std::make_shared<ProxyApi::Response>(std::move(res));
        stream_.expires_after(WRITE_TIMEOUT);
        auto self = shared_from_this();
        http::async_write(stream_, *msg, [self, msg](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    std::cerr << "HttpServer: write failed: " << ec.message() << std::endl;
                }
                return self->close();
            }
            if (msg->need_eof()) return self->close();
            self->do_read();
        });
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    ProxyApi::Request req_;
    HttpServer::RequestHandler handler_;
    std::shared_ptr<HttpServer::SessionSet> set_;
};

} // namespace detail

HttpServer::HttpServer(asio::io_context& ioc, std::string host, uint16_t port, RequestHandler handler)
: ioc_(ioc), host_(std::move(host)), port_(port), handler_(std::move(handler)), acceptor_(ioc),
  sessions_(std::make_shared<SessionSet>()) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) return;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host_, std::to_string(port_));
    tcp::endpoint ep = results.begin()->endpoint();

    acceptor_.open(ep.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    running_ = true;
    std::cout << "HttpServer: listening on " << host_ << ":" << local_port() << std::endl;
    do_accept();
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
    for (auto& s : sessions_->snapshot()) s->close();
}

uint16_t HttpServer::local_port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? port_ : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            if (running_) std::cerr << "HttpServer: accept error: " << ec.message() << std::endl;
        } else {
            std::make_shared<HttpSession>(std::move(socket), handler_, sessions_)->start();
        }
        if (running_) do_accept();
    });
}

} // namespace upnpbridge::net
