#include "beamdrop/network/download_server.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/hash.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <array>

namespace beamdrop::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
    constexpr std::string_view DOWNLOAD_PREFIX = "/download/";
    constexpr std::size_t PIECE_SIZE = 64 * 1024;
    constexpr auto IDLE_TIMEOUT = std::chrono::seconds(60);
    
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(tcp::socket&& socket, std::shared_ptr<storage::Store> store, const DownloadTarget& target)
            : stream_(std::move(socket))
            , store_(std::move(store))
            , target_(target) {
        }
        
        void run() {
            net::dispatch(stream_.get_executor(),
                          beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
        }
    
    private:
        void do_read() {
            request_ = {};
            stream_.expires_after(IDLE_TIMEOUT);
            http::async_read(stream_, buffer_, request_,
                             beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
        }
        
        void on_read(beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                do_close();
                return;
            }
            if (ec) {
                LOG_DEBUG("HTTP read failed: {}", ec.message());
                return;
            }
            handle_request();
        }
        
        void handle_request() {
            std::string target(request_.target());
            LOG_DEBUG("HTTP {} {}", std::string(request_.method_string()), target);
            
            if (request_.method() != http::verb::get) {
                send_text(http::status::method_not_allowed, "method not allowed\n", true);
                return;
            }
            
            auto query = target.find('?');
            if (query != std::string::npos) {
                target = target.substr(0, query);
            }
            if (!core::utils::StringUtils::starts_with(target, std::string(DOWNLOAD_PREFIX))) {
                send_text(http::status::not_found, "not found\n");
                return;
            }
            
            auto id = target.substr(DOWNLOAD_PREFIX.size());
            auto hash = id.size() == 64 ? crypto::hash_utils::hash_from_hex(id) : std::nullopt;
            if (!hash) {
                send_text(http::status::bad_request, "invalid download id\n");
                return;
            }
            
            try {
                if (*hash != target_.hash || !store_->has(*hash)) {
                    send_text(http::status::not_found, "not found\n");
                    return;
                }
                reader_ = store_->reader(*hash);
            } catch (const core::TransferError& e) {
                LOG_WARN("Cannot serve {}: {}", id, e.what());
                send_text(http::status::not_found, "not found\n");
                return;
            }
            
            start_download();
        }
        
        void send_text(http::status status, const std::string& body, bool allow_header = false) {
            auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
            response->set(http::field::server, BOOST_BEAST_VERSION_STRING);
            response->set(http::field::content_type, "text/plain");
            if (allow_header) {
                response->set(http::field::allow, "GET");
            }
            response->keep_alive(request_.keep_alive());
            response->body() = body;
            response->prepare_payload();
            
            auto self = shared_from_this();
            http::async_write(stream_, *response,
                [self, response](beast::error_code ec, std::size_t) {
                    self->on_response_written(ec, response->need_eof());
                });
        }
        
        void start_download() {
            response_ = std::make_shared<http::response<http::buffer_body>>(http::status::ok, request_.version());
            response_->set(http::field::server, BOOST_BEAST_VERSION_STRING);
            response_->set(http::field::content_type, "application/octet-stream");
            response_->set(http::field::content_disposition,
                           "attachment; filename=\"" + sanitize_filename(target_.name) + "\"");
            response_->content_length(reader_->size());
            response_->keep_alive(request_.keep_alive());
            response_->body().data = nullptr;
            response_->body().more = true;
            
            serializer_ = std::make_shared<http::response_serializer<http::buffer_body>>(*response_);
            
            stream_.expires_after(IDLE_TIMEOUT);
            http::async_write_header(stream_, *serializer_,
                beast::bind_front_handler(&HttpSession::on_piece_written, shared_from_this()));
        }
        
        void write_piece() {
            std::size_t n = 0;
            try {
                n = reader_->read(piece_);
            } catch (const core::TransferError& e) {
                LOG_ERROR("Failed reading blob for download: {}", e.what());
                do_close();
                return;
            }
            
            if (n == 0) {
                response_->body().data = nullptr;
                response_->body().more = false;
            } else {
                response_->body().data = piece_.data();
                response_->body().size = n;
                response_->body().more = true;
            }
            
            stream_.expires_after(IDLE_TIMEOUT);
            http::async_write(stream_, *serializer_,
                beast::bind_front_handler(&HttpSession::on_piece_written, shared_from_this()));
        }
        
        void on_piece_written(beast::error_code ec, std::size_t) {
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                LOG_DEBUG("HTTP download aborted: {}", ec.message());
                return;
            }
            
            if (!serializer_->is_done()) {
                write_piece();
                return;
            }
            
            LOG_INFO("Download of {} complete", target_.name);
            bool close = response_->need_eof();
            serializer_.reset();
            response_.reset();
            reader_.reset();
            on_response_written({}, close);
        }
        
        void on_response_written(beast::error_code ec, bool close) {
            if (ec) {
                LOG_DEBUG("HTTP write failed: {}", ec.message());
                return;
            }
            if (close) {
                do_close();
                return;
            }
            do_read();
        }
        
        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
        
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        std::shared_ptr<storage::Store> store_;
        const DownloadTarget& target_;
        
        std::unique_ptr<storage::BlobReader> reader_;
        std::shared_ptr<http::response<http::buffer_body>> response_;
        std::shared_ptr<http::response_serializer<http::buffer_body>> serializer_;
        std::array<std::uint8_t, PIECE_SIZE> piece_;
    };
}

std::string sanitize_filename(const std::string& name) {
    std::string result = name;
    for (auto& c : result) {
        if (c == '"' || c == '\\' || c == '\r' || c == '\n') {
            c = '_';
        }
    }
    return result;
}

DownloadServer::DownloadServer(std::shared_ptr<storage::Store> store, DownloadTarget target, std::size_t threads)
    : store_(std::move(store))
    , target_(std::move(target))
    , thread_count_(threads == 0 ? 1 : threads)
    , io_context_(static_cast<int>(thread_count_))
    , acceptor_(net::make_strand(io_context_))
    , running_(false)
    , port_(0) {
}

DownloadServer::~DownloadServer() {
    stop();
    join();
}

void DownloadServer::start(const std::string& address, std::uint16_t port) {
    if (running_) {
        LOG_WARN("Download server already running");
        return;
    }
    
    beast::error_code ec;
    auto bind_address = net::ip::make_address(address, ec);
    if (ec) {
        throw core::TransferError(core::ErrorCode::TransportError, "invalid bind address " + address);
    }
    
    tcp::endpoint endpoint(bind_address, port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw core::TransferError(core::ErrorCode::TransportError,
                                  "failed to start download server on " + address + ": " + ec.message());
    }
    
    address_ = address;
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    
    do_accept();
    
    threads_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Download server IO error: {}", e.what());
            }
        });
    }
    
    LOG_INFO("Download server listening on {}", local_url());
}

void DownloadServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_DEBUG("Stopping download server on port {}", port_);
    io_context_.stop();
}

void DownloadServer::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    
    // No I/O thread is left to race with
    beast::error_code ec;
    acceptor_.close(ec);
}

std::string DownloadServer::local_url() const {
    return "http://" + address_ + ":" + std::to_string(port_);
}

std::string DownloadServer::download_path() const {
    return std::string(DOWNLOAD_PREFIX) + crypto::hash_utils::hash_to_hex(target_.hash);
}

void DownloadServer::do_accept() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    LOG_WARN("Download server accept error: {}", ec.message());
                }
            } else {
                std::make_shared<HttpSession>(std::move(socket), store_, target_)->run();
            }
            
            if (running_) {
                do_accept();
            }
        });
}

}
