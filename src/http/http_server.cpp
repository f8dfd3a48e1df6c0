#include "filelink/http/http_server.h"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "filelink/core/ids.h"
#include "filelink/core/logger.h"
#include "filelink/http/access_request.h"
#include "filelink/http/content_disposition.h"
#include "filelink/http/player_page.h"
#include "filelink/http/status_mapping.h"
#include "filelink/observability/metrics.h"
#include "filelink/stream/chunk_scheduler.h"
#include "filelink/stream/range_resolver.h"
#include "filelink/stream/stream_session.h"

namespace filelink::http {

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/// @brief State shared by the listener and every connection it accepts.
struct ServerContext {
    ServerContext(const core::Config& config_in, Router router_in,
                  std::shared_ptr<registry::ObjectRegistry> registry_in,
                  std::shared_ptr<source::ChunkSource> source_in,
                  net::any_io_executor backend_in)
        : router(std::move(router_in)),
          config(config_in),
          registry(std::move(registry_in)),
          source(std::move(source_in)),
          backend(std::move(backend_in)),
          admission(static_cast<std::size_t>(config_in.admission.max_sessions)),
          scheduler_options(stream::MakeSchedulerOptions(config_in.stream)) {}

    Router router;
    core::Config config;
    std::shared_ptr<registry::ObjectRegistry> registry;
    std::shared_ptr<source::ChunkSource> source;
    net::any_io_executor backend;
    stream::AdmissionController admission;
    stream::SchedulerOptions scheduler_options;
};

namespace {

constexpr char kServerName[] = "FileLink";

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    static constexpr bool kIsTls = std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>;

    Session(Stream&& stream, std::shared_ptr<ServerContext> context)
        : stream_(std::move(stream)),
          context_(std::move(context)),
          resolve_timer_(stream_.get_executor()),
          idle_timer_(stream_.get_executor()) {}

    void Start() {
        // Everything below runs on the connection strand.
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::Run, this->shared_from_this()));
    }

private:
    void Run() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (kIsTls) {
            beast::get_lowest_layer(stream_).expires_after(IdleTimeout());
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoRead();
        }
    }

    void OnHandshake(beast::error_code ec) {
        if (ec) {
            core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoRead();
    }

    void DoRead() {
        parser_.emplace();
        parser_->body_limit(context_->config.server.limits.max_body_bytes);
        beast::get_lowest_layer(stream_).expires_after(IdleTimeout());
        beast_http::async_read(stream_, buffer_, *parser_,
                               beast::bind_front_handler(&Session::OnRead,
                                                         this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == beast::error::timeout) {
            core::LogDebug("Closing idle connection from " + GetRemoteAddress());
            return;
        }
        if (ec) {
            core::LogError("Read failed: " + ec.message());
            return;
        }
        request_ = parser_->release();
        HandleRequest();
    }

    void HandleRequest() {
        request_id_ = core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(request_.method_string());
        request_target_ = std::string(request_.target());
        request_remote_ = GetRemoteAddress();
        headers_sent_ = false;

        const auto path = StripQuery(request_target_);
        RouteParams params;
        if (Router::Match("/dl/{object_id}", path, &params)) {
            return HandleObject(params["object_id"], DisplayMode::kDownload);
        }
        if (Router::Match("/stream/{object_id}", path, &params)) {
            return HandleObject(params["object_id"], DisplayMode::kPlayer);
        }

        RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = request_method_;
        ctx.target = request_target_;
        ctx.remote = request_remote_;
        ctx.base_url = BaseUrl();
        auto result = context_->router.Route(ctx, request_);
        if (!result.ok()) {
            return SendError(result.error());
        }
        Send(std::move(result.value()));
    }

    void HandleObject(const std::string& id_segment, DisplayMode default_mode) {
        if (request_.method() != beast_http::verb::get) {
            return Send(ErrorResponse(beast_http::status::method_not_allowed, request_.version(),
                                      "METHOD_NOT_ALLOWED", "method not allowed", request_id_));
        }
        auto parsed = ParseAccessRequest(id_segment, request_target_, default_mode);
        if (!parsed.ok()) {
            return SendError(parsed.error());
        }
        access_ = parsed.value();

        auto slot = context_->admission.TryAcquire();
        if (!slot) {
            observability::RecordAdmissionRejected();
            core::LogWarning("Admission ceiling of " +
                             std::to_string(context_->admission.ceiling()) +
                             " sessions reached; rejecting request " + request_id_);
            auto response = ErrorResponse(beast_http::status::service_unavailable,
                                          request_.version(), "BUSY",
                                          "Server is busy, try again later.", request_id_);
            response.set(beast_http::field::retry_after, "1");
            return Send(std::move(response));
        }

        session_ = std::make_unique<stream::StreamSession>(request_id_, std::move(*slot));
        session_->SetObject(access_.object_id);
        auto advanced = session_->Advance(stream::StreamState::kResolving);
        if (!advanced.ok()) {
            return FailBeforeHeaders(advanced.error());
        }
        StartResolve();
    }

    void StartResolve() {
        const auto token = ++resolve_token_;
        auto self = this->shared_from_this();
        resolve_timer_.expires_after(
            std::chrono::milliseconds(context_->config.registry.resolve_timeout_ms));
        resolve_timer_.async_wait([self, token](beast::error_code ec) {
            if (ec) {
                return;
            }
            self->OnResolved(token, core::Error{core::ErrorCode::kUnavailable,
                                                "registry lookup timed out"});
        });

        const auto object_id = access_.object_id;
        const auto code = access_.code;
        net::post(context_->backend, [self, token, object_id, code]() {
            auto result = self->context_->registry->Resolve(object_id, code);
            net::post(self->stream_.get_executor(),
                      [self, token, result = std::move(result)]() mutable {
                          self->OnResolved(token, std::move(result));
                      });
        });
    }

    void OnResolved(std::uint64_t token, core::Result<registry::ResolvedObject> result) {
        if (token != resolve_token_ || !session_) {
            return;
        }
        // Whichever of lookup and timeout lands first wins; the other is ignored.
        ++resolve_token_;
        resolve_timer_.cancel();

        if (!result.ok()) {
            auto error = result.error();
            if (error.code == core::ErrorCode::kTimeout) {
                error.code = core::ErrorCode::kUnavailable;
            }
            if (error.code == core::ErrorCode::kForbidden) {
                core::LogWarning("Access denied for object " +
                                 std::to_string(access_.object_id) + ": invalid code");
            } else if (error.code == core::ErrorCode::kUnavailable) {
                core::LogError("Registry lookup for object " +
                               std::to_string(access_.object_id) + " failed: " + error.message);
            }
            return FailBeforeHeaders(error);
        }
        resolved_.emplace(std::move(result.value()));
        if (access_.mode == DisplayMode::kPlayer) {
            return ServePlayer();
        }
        StartWindowing();
    }

    void ServePlayer() {
        PlayerPageContext page;
        page.file_name = resolved_->file_name;
        page.size_bytes = resolved_->size_bytes;
        page.mime_type = resolved_->mime_type;
        page.media_url = BaseUrl() + "/dl/" + std::to_string(access_.object_id) +
                         "?code=" + EncodeQueryValue(access_.code);

        // A player request ends once the reference is validated; no stream is opened.
        session_.reset();
        resolved_.reset();

        HttpResponse response{beast_http::status::ok, request_.version()};
        response.set(beast_http::field::content_type, "text/html; charset=utf-8");
        response.body() = RenderPlayerPage(page);
        response.prepare_payload();
        Send(std::move(response));
    }

    void StartWindowing() {
        auto advanced = session_->Advance(stream::StreamState::kWindowing);
        if (!advanced.ok()) {
            return FailBeforeHeaders(advanced.error());
        }

        const auto size = resolved_->size_bytes;
        auto range = stream::ResolveRange(std::string(request_[beast_http::field::range]), size);
        if (!range.ok()) {
            session_->Fail(range.error().message);
            session_.reset();
            resolved_.reset();
            HttpResponse response{beast_http::status::range_not_satisfiable, request_.version()};
            response.set(beast_http::field::content_range,
                         stream::UnsatisfiedContentRangeValue(size));
            response.prepare_payload();
            return Send(std::move(response));
        }

        const auto resolution = range.value();
        session_->SetWindow(resolution.window);
        advanced = session_->Advance(stream::StreamState::kStreaming);
        if (!advanced.ok()) {
            return FailBeforeHeaders(advanced.error());
        }
        StartStreaming(resolution);
    }

    void StartStreaming(const stream::RangeResolution& resolution) {
        const auto& object = *resolved_;
        const auto& window = resolution.window;

        response_.emplace(resolution.partial ? beast_http::status::partial_content
                                             : beast_http::status::ok,
                          request_.version());
        response_->set(beast_http::field::server, kServerName);
        response_->set("X-Request-Id", request_id_);
        response_->set(beast_http::field::content_type, object.mime_type);
        response_->set(beast_http::field::content_disposition,
                       AttachmentDisposition(object.file_name));
        response_->set(beast_http::field::accept_ranges, "bytes");
        response_->set(beast_http::field::cache_control, "public, max-age=3600");
        if (resolution.partial) {
            response_->set(beast_http::field::content_range,
                           stream::ContentRangeValue(window, object.size_bytes));
        }
        response_->content_length(window.length());
        response_->keep_alive(request_.keep_alive());
        response_->body().data = nullptr;
        response_->body().more = true;
        serializer_.emplace(*response_);

        // Streaming progress is policed by the idle timer, not the socket deadline.
        beast::get_lowest_layer(stream_).expires_never();
        WatchForDisconnect();

        auto scheduler = std::make_shared<stream::ChunkScheduler>(
            stream_.get_executor(), context_->backend, context_->source, object.handle, window,
            context_->scheduler_options);
        session_->AttachScheduler(scheduler);
        if (scheduler->chunk_count() == 0) {
            CommitHeaders();
            return FinishBody();
        }
        scheduler->Start();
        RequestNextChunk();
    }

    void RequestNextChunk() {
        ArmIdleTimer();
        auto self = this->shared_from_this();
        session_->scheduler()->NextChunk(
            [self](stream::Chunk chunk) { self->OnChunk(std::move(chunk)); });
    }

    void OnChunk(stream::Chunk chunk) {
        if (!session_ || session_->terminal()) {
            return;
        }
        if (!chunk.ok()) {
            const auto message = chunk.error->message;
            if (!headers_sent_) {
                // Nothing is on the wire yet, so the client still gets a clean error.
                StopWatching();
                serializer_.reset();
                response_.reset();
                return FailBeforeHeaders(core::Error{core::ErrorCode::kIoError, message});
            }
            core::LogError("Stream " + request_id_ + " failed after " +
                           std::to_string(session_->bytes_sent()) + " bytes: " + message);
            session_->Fail(message);
            return AbortConnection();
        }

        current_bytes_ = std::move(chunk.bytes);
        last_chunk_ = chunk.last;
        CommitHeaders();
        ArmIdleTimer();
        response_->body().data = current_bytes_.data();
        response_->body().size = current_bytes_.size();
        response_->body().more = true;
        auto self = this->shared_from_this();
        beast_http::async_write(stream_, *serializer_,
                                [self](beast::error_code ec, std::size_t bytes) {
                                    self->OnChunkWritten(ec, bytes);
                                });
    }

    void OnChunkWritten(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::need_buffer) {
            ec = {};
        }
        if (!session_ || session_->terminal()) {
            return;
        }
        if (ec) {
            core::LogWarning("Stream " + request_id_ + " write failed: " + ec.message());
            session_->Abort("client disconnected: " + ec.message());
            return AbortConnection();
        }
        session_->AddBytesSent(current_bytes_.size());
        current_bytes_.clear();
        if (last_chunk_) {
            return FinishBody();
        }
        RequestNextChunk();
    }

    void FinishBody() {
        response_->body().data = nullptr;
        response_->body().size = 0;
        response_->body().more = false;
        auto self = this->shared_from_this();
        beast_http::async_write(stream_, *serializer_,
                                [self](beast::error_code ec, std::size_t) {
                                    self->OnBodyFinished(ec);
                                });
    }

    void OnBodyFinished(beast::error_code ec) {
        if (ec == beast_http::error::need_buffer) {
            ec = {};
        }
        if (!session_ || session_->terminal()) {
            return;
        }
        idle_timer_.cancel();
        StopWatching();
        if (ec) {
            session_->Abort("client disconnected: " + ec.message());
            return AbortConnection();
        }

        session_->Complete();
        const bool keep_alive = response_->keep_alive();
        serializer_.reset();
        response_.reset();
        session_.reset();
        resolved_.reset();
        if (!keep_alive) {
            return DoClose();
        }
        DoRead();
    }

    void CommitHeaders() {
        if (headers_sent_) {
            return;
        }
        headers_sent_ = true;
        LogAndRecord(response_->result_int());
    }

    void ArmIdleTimer() {
        const auto generation = ++idle_generation_;
        auto self = this->shared_from_this();
        idle_timer_.expires_after(IdleTimeout());
        idle_timer_.async_wait([self, generation](beast::error_code ec) {
            if (ec || generation != self->idle_generation_) {
                return;
            }
            self->OnIdleTimeout();
        });
    }

    void OnIdleTimeout() {
        if (!session_ || session_->terminal()) {
            return;
        }
        core::LogWarning("Stream " + request_id_ + " made no progress for " +
                         std::to_string(context_->config.stream.idle_timeout_seconds) +
                         "s; closing connection");
        session_->Fail("idle timeout");
        AbortConnection();
    }

    // The peer sends nothing while a response streams, so readability means it closed
    // the connection (or pipelined its next request).
    void WatchForDisconnect() {
        const auto generation = ++watch_generation_;
        auto self = this->shared_from_this();
        beast::get_lowest_layer(stream_).socket().async_wait(
            tcp::socket::wait_read, [self, generation](beast::error_code ec) {
                self->OnPeerReadable(ec, generation);
            });
    }

    void OnPeerReadable(beast::error_code ec, std::uint64_t generation) {
        if (ec == net::error::operation_aborted || generation != watch_generation_ ||
            !session_ || session_->terminal()) {
            return;
        }
        if (!ec) {
            const auto pending = beast::get_lowest_layer(stream_).socket().available(ec);
            if (!ec && pending > 0) {
                // Pipelined request; it is read once this response is done.
                return;
            }
        }
        core::LogWarning("Stream " + request_id_ + " client went away after " +
                         std::to_string(session_->bytes_sent()) + " bytes");
        session_->Abort("client disconnected");
        AbortConnection();
    }

    void StopWatching() {
        ++watch_generation_;
        beast::error_code ec;
        beast::get_lowest_layer(stream_).socket().cancel(ec);
    }

    void AbortConnection() {
        // Pending writes complete with an error and find the session terminal.
        ++idle_generation_;
        ++watch_generation_;
        idle_timer_.cancel();
        beast::error_code ec;
        beast::get_lowest_layer(stream_).socket().close(ec);
    }

    void FailBeforeHeaders(const core::Error& error) {
        if (session_) {
            session_->Fail(error.message);
            session_.reset();
        }
        resolved_.reset();
        SendError(error);
    }

    void SendError(const core::Error& error) {
        Send(ErrorResponseFor(error, request_.version(), request_id_));
    }

    void LogAndRecord(int status) {
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        core::LogRequest(request_id_, request_method_, request_target_, request_remote_, status,
                         latency);
        observability::RecordRequest(status, latency);
    }

    template <typename Body>
    void Send(beast_http::response<Body>&& response) {
        response.set(beast_http::field::server, kServerName);
        response.set("X-Request-Id", request_id_);
        response.keep_alive(request_.keep_alive());
        LogAndRecord(response.result_int());
        auto sp = std::make_shared<beast_http::response<Body>>(std::move(response));
        beast_http::async_write(stream_, *sp,
                                beast::bind_front_handler(&Session::OnWrite<Body>,
                                                          this->shared_from_this(),
                                                          sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<beast_http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (kIsTls) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string BaseUrl() const {
        return RequestBaseUrl(request_, context_->config.links.public_base_url, kIsTls);
    }

    std::chrono::seconds IdleTimeout() const {
        return std::chrono::seconds(context_->config.stream.idle_timeout_seconds);
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<ServerContext> context_;
    std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
    HttpRequest request_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};

    AccessRequest access_;
    net::steady_timer resolve_timer_;
    std::uint64_t resolve_token_{0};
    std::optional<registry::ResolvedObject> resolved_;

    std::unique_ptr<stream::StreamSession> session_;
    std::optional<beast_http::response<beast_http::buffer_body>> response_;
    std::optional<beast_http::response_serializer<beast_http::buffer_body>> serializer_;
    std::string current_bytes_;
    bool last_chunk_{false};
    bool headers_sent_{false};
    net::steady_timer idle_timer_;
    std::uint64_t idle_generation_{0};
    std::uint64_t watch_generation_{0};
};

}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, std::shared_ptr<ServerContext> context,
             net::ssl::context* ssl_ctx)
        : ioc_(ioc),
          acceptor_(net::make_strand(ioc)),
          context_(std::move(context)),
          ssl_ctx_(ssl_ctx) {}

    core::Result<void> Open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            return core::Error{core::ErrorCode::kInternal,
                               "failed to listen on " + endpoint.address().to_string() + ":" +
                                   std::to_string(endpoint.port()) + ": " + ec.message()};
        }
        port_ = acceptor_.local_endpoint(ec).port();
        return core::Ok();
    }

    void Run() { DoAccept(); }

    void Stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    unsigned short port() const { return port_; }

private:
    void DoAccept() {
        // Each connection gets its own strand.
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            core::LogError("Accept failed: " + ec.message());
        } else if (ssl_ctx_) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(std::move(stream),
                                                                            context_)
                ->Start();
        } else {
            auto stream = beast::tcp_stream(std::move(socket));
            std::make_shared<Session<beast::tcp_stream>>(std::move(stream), context_)->Start();
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<ServerContext> context_;
    net::ssl::context* ssl_ctx_{nullptr};
    unsigned short port_{0};
};

HttpServer::HttpServer(net::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<registry::ObjectRegistry> registry,
                       std::shared_ptr<source::ChunkSource> source)
    : ioc_(ioc),
      backend_pool_(static_cast<std::size_t>(std::max(config.backend.threads, 1))) {
    if (config.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config.server.tls.certificate);
        ssl_context_->use_private_key_file(config.server.tls.private_key, net::ssl::context::pem);
    }
    context_ = std::make_shared<ServerContext>(config, std::move(router), std::move(registry),
                                               std::move(source), backend_pool_.get_executor());
}

HttpServer::~HttpServer() {
    Stop();
    backend_pool_.stop();
    backend_pool_.join();
}

core::Result<void> HttpServer::Run() {
    const auto& server = context_->config.server;
    beast::error_code ec;
    const auto address = net::ip::make_address(server.host, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "invalid listen address: " + server.host};
    }
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(server.port)};

    auto listener = std::make_shared<Listener>(ioc_, context_, ssl_context_.get());
    auto opened = listener->Open(endpoint);
    if (!opened.ok()) {
        return opened.error();
    }
    listener->Run();
    listener_ = std::move(listener);
    core::LogInfo("FileLink listening on " + server.host + ":" + std::to_string(port()) +
                  (ssl_context_ ? " (tls)" : ""));
    return core::Ok();
}

void HttpServer::Stop() {
    if (listener_) {
        listener_->Stop();
    }
}

unsigned short HttpServer::port() const { return listener_ ? listener_->port() : 0; }

const stream::AdmissionController& HttpServer::admission() const { return context_->admission; }

}  // namespace filelink::http
