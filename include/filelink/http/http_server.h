#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "filelink/core/config.h"
#include "filelink/core/result.h"
#include "filelink/http/router.h"
#include "filelink/registry/object_registry.h"
#include "filelink/source/chunk_source.h"
#include "filelink/stream/admission.h"

namespace filelink::http {

struct ServerContext;
class Listener;

/// @brief HTTP server bootstrapper (acceptor, TLS context, backend worker pool).
///
/// `/dl/{id}` and `/stream/{id}` are served by the streaming engine; every other target goes
/// through the router. Registry lookups and chunk reads run on a dedicated thread pool of
/// `backend.threads` workers so the io_context threads never block on the remote source.
/// The server must outlive the threads running `ioc`.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<registry::ObjectRegistry> registry,
               std::shared_ptr<source::ChunkSource> source);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Bind the listening socket and start accepting connections.
    core::Result<void> Run();
    /// @brief Stop accepting new connections; established sessions run to completion.
    void Stop();

    /// @brief Port actually bound; differs from the configured one when that was 0.
    unsigned short port() const;
    const stream::AdmissionController& admission() const;

private:
    boost::asio::io_context& ioc_;
    boost::asio::thread_pool backend_pool_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::shared_ptr<ServerContext> context_;
    std::shared_ptr<Listener> listener_;
};

}  // namespace filelink::http
