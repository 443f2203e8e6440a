#include "peersend/network/http_exchange.hpp"
#include "peersend/network/protocol.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>

namespace peersend::network {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

namespace {

class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    HttpExchange(boost::asio::io_context& io_context, HttpResponseHandler handler)
        : resolver_(io_context)
        , stream_(io_context)
        , handler_(std::move(handler)) {
    }
    
    void run(HttpRequestOptions options, std::chrono::milliseconds timeout) {
        timeout_ = timeout;
        
        request_.version(11);
        request_.method(options.method);
        request_.target(options.target);
        request_.set(http::field::host, options.host + ":" + std::to_string(options.port));
        request_.set(http::field::user_agent, std::string("peersend/") + PEERSEND_VERSION);
        if (options.method != http::verb::get) {
            request_.set(http::field::content_type, options.content_type);
            request_.body() = std::move(options.body);
        }
        request_.prepare_payload();
        
        resolver_.async_resolve(options.host, std::to_string(options.port),
            beast::bind_front_handler(&HttpExchange::on_resolve, shared_from_this()));
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail("resolve", ec);
        }
        stream_.expires_after(timeout_);
        stream_.async_connect(results,
            beast::bind_front_handler(&HttpExchange::on_connect, shared_from_this()));
    }
    
    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail("connect", ec);
        }
        http::async_write(stream_, request_,
            beast::bind_front_handler(&HttpExchange::on_write, shared_from_this()));
    }
    
    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail("write", ec);
        }
        http::async_read(stream_, buffer_, response_,
            beast::bind_front_handler(&HttpExchange::on_read, shared_from_this()));
    }
    
    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail("read", ec);
        }
        
        beast::error_code shutdown_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        
        HttpResponse response;
        response.status = response_.result_int();
        response.body = std::move(response_.body());
        finish(std::move(response));
    }
    
    void fail(const char* stage, beast::error_code ec) {
        HttpResponse response;
        response.error = std::string(stage) + ": " + ec.message();
        finish(std::move(response));
    }
    
    void finish(HttpResponse response) {
        if (handler_) {
            auto handler = std::move(handler_);
            handler_ = nullptr;
            handler(std::move(response));
        }
    }
    
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    std::chrono::milliseconds timeout_{0};
    HttpResponseHandler handler_;
};

}

void async_http_request(boost::asio::io_context& io_context,
                        HttpRequestOptions options,
                        std::chrono::milliseconds timeout,
                        HttpResponseHandler handler) {
    std::make_shared<HttpExchange>(io_context, std::move(handler))->run(std::move(options), timeout);
}

}
