#include "peersend/network/http_server.hpp"
#include "peersend/crypto/crypto_types.hpp"
#include "peersend/core/logger.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>

namespace peersend::network {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

namespace {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, ApiHandler& handler, std::uint64_t body_limit,
                std::chrono::seconds read_timeout)
        : stream_(std::move(socket))
        , handler_(handler)
        , body_limit_(body_limit)
        , read_timeout_(read_timeout) {
        beast::error_code ec;
        auto endpoint = stream_.socket().remote_endpoint(ec);
        remote_ip_ = ec ? "unknown" : endpoint.address().to_string();
    }
    
    void run() {
        boost::asio::dispatch(stream_.get_executor(),
            beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        
        stream_.expires_after(read_timeout_);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }
    
    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return do_close();
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted) {
                LOG_DEBUG("HTTP read from {} failed: {}", remote_ip_, ec.message());
            }
            return;
        }
        
        send_response(process(parser_->release()));
    }
    
    http::response<http::string_body> process(const http::request<http::string_body>& request) {
        std::string_view target(request.target().data(), request.target().size());
        auto type = parse_request_type(target);
        
        auto query_pos = target.find('?');
        auto query = query_pos == std::string_view::npos ? std::string_view{} : target.substr(query_pos + 1);
        
        ApiResponse result;
        if (type != RequestType::REGISTER && type != RequestType::UNKNOWN &&
            request.method() != http::verb::post) {
            result = make_error(405, "method not allowed");
        } else {
            try {
                result = handler_.handle(type, request.body(), query, remote_ip_);
            } catch (const std::exception& e) {
                LOG_ERROR("Handler for {} failed: {}", std::string(target), e.what());
                result = make_error(500, "internal error");
            }
        }
        
        http::response<http::string_body> response{static_cast<http::status>(result.status), request.version()};
        response.set(http::field::server, std::string("peersend/") + PEERSEND_VERSION);
        response.set(http::field::content_type, result.content_type);
        response.keep_alive(request.keep_alive());
        response.body() = std::move(result.body);
        response.prepare_payload();
        return response;
    }
    
    void send_response(http::response<http::string_body> response) {
        auto shared = std::make_shared<http::response<http::string_body>>(std::move(response));
        response_ = shared;
        
        http::async_write(stream_, *shared,
            beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), shared->need_eof()));
    }
    
    void on_write(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("HTTP write to {} failed: {}", remote_ip_, ec.message());
            return;
        }
        if (close) {
            return do_close();
        }
        
        response_.reset();
        do_read();
    }
    
    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
    
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::string_body>> response_;
    ApiHandler& handler_;
    std::uint64_t body_limit_;
    std::chrono::seconds read_timeout_;
    std::string remote_ip_;
};

}

HttpServer::HttpServer(boost::asio::io_context& io_context, ApiHandler& handler,
                       std::size_t max_chunk_size)
    : io_context_(io_context)
    , acceptor_(io_context)
    , handler_(handler)
    , body_limit_(max_chunk_size + crypto::NONCE_SIZE + crypto::AEAD_TAG_SIZE + 64 * 1024)
    , read_timeout_(std::chrono::seconds(30))
    , running_(false)
    , bound_port_(0) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::uint16_t port) {
    if (running_) {
        LOG_WARN("HTTP server already running");
        return false;
    }
    
    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start HTTP server on port {}: {}", port, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }
    
    running_ = true;
    do_accept();
    
    LOG_INFO("HTTP server listening on port {}", bound_port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    boost::system::error_code ec;
    acceptor_.close(ec);
    LOG_INFO("HTTP server on port {} stopped", bound_port_);
}

void HttpServer::do_accept() {
    if (!running_) {
        return;
    }
    
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }
            
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_WARN("Accept error: {}", ec.message());
                }
            } else {
                std::make_shared<HttpSession>(std::move(socket), handler_, body_limit_, read_timeout_)->run();
            }
            do_accept();
        });
}

}
