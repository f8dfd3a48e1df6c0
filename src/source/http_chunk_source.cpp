#include "filelink/source/http_chunk_source.h"

#include <memory>
#include <mutex>

#include <Poco/Exception.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/RejectCertificateHandler.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>
#include <Poco/URI.h>

namespace filelink::source {

namespace {

void InitializeClientSsl() {
    static std::once_flag ssl_once;
    std::call_once(ssl_once, []() {
        Poco::Net::initializeSSL();
        Poco::Net::Context::Ptr context =
            new Poco::Net::Context(Poco::Net::Context::CLIENT_USE, "", "", "",
                                   Poco::Net::Context::VERIFY_STRICT, 9, true);
        Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> handler(
            new Poco::Net::RejectCertificateHandler(false));
        Poco::Net::SSLManager::instance().initializeClient(nullptr, handler, context);
    });
}

}  // namespace

HttpChunkSource::HttpChunkSource(std::string base_url, SourceLimits limits,
                                 std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), limits_(limits), timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

core::Result<std::string> HttpChunkSource::Read(const ObjectHandle& handle, std::uint64_t offset,
                                                std::uint64_t length) {
    if (length == 0 || length > limits_.max_call_bytes) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "read length " + std::to_string(length) + " exceeds call limit"};
    }

    try {
        Poco::URI uri(base_url_ + "/" + handle.location());
        const bool is_https = uri.getScheme() == "https";
        const std::string host = uri.getHost();
        const int port = uri.getPort() > 0 ? uri.getPort() : (is_https ? 443 : 80);
        const std::string path = uri.getPathEtc().empty() ? "/" : uri.getPathEtc();

        std::unique_ptr<Poco::Net::HTTPClientSession> session;
        if (is_https) {
            InitializeClientSsl();
            session = std::make_unique<Poco::Net::HTTPSClientSession>(host, port);
        } else {
            session = std::make_unique<Poco::Net::HTTPClientSession>(host, port);
        }
        session->setTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(
            std::chrono::duration_cast<std::chrono::microseconds>(timeout_).count())));

        Poco::Net::HTTPRequest req(Poco::Net::HTTPRequest::HTTP_GET, path,
                                   Poco::Net::HTTPMessage::HTTP_1_1);
        req.set("Host", host);
        req.set("User-Agent", "filelink-chunk-source");
        req.set("Range", "bytes=" + std::to_string(offset) + "-" +
                             std::to_string(offset + length - 1));
        session->sendRequest(req);

        Poco::Net::HTTPResponse res;
        std::istream& rs = session->receiveResponse(res);
        const auto status = res.getStatus();
        if (status == Poco::Net::HTTPResponse::HTTP_REQUESTED_RANGE_NOT_SATISFIABLE) {
            // Offset past the end of the object: an empty read, like a file at EOF.
            return std::string();
        }
        if (status == Poco::Net::HTTPResponse::HTTP_NOT_FOUND) {
            return core::Error{core::ErrorCode::kNotFound, "upstream object missing"};
        }
        if (status != Poco::Net::HTTPResponse::HTTP_PARTIAL_CONTENT) {
            return core::Error{core::ErrorCode::kIoError,
                               "upstream answered " + std::to_string(static_cast<int>(status)) +
                                   " to a range read"};
        }
        std::string body;
        Poco::StreamCopier::copyToString(rs, body);
        if (body.size() > length) {
            body.resize(static_cast<std::size_t>(length));
        }
        return body;
    } catch (const Poco::TimeoutException& ex) {
        return core::Error{core::ErrorCode::kTimeout, ex.displayText()};
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kUnavailable, ex.displayText()};
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kIoError, ex.what()};
    }
}

}  // namespace filelink::source
