#include "filelink/http/status_mapping.h"

#include <Poco/JSON/Object.h>

#include <sstream>

namespace filelink::http {

namespace beast_http = boost::beast::http;

beast_http::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return beast_http::status::ok;
        case core::ErrorCode::kInvalidArgument:
            return beast_http::status::bad_request;
        case core::ErrorCode::kUnauthorized:
            return beast_http::status::unauthorized;
        case core::ErrorCode::kForbidden:
            return beast_http::status::forbidden;
        case core::ErrorCode::kNotFound:
            return beast_http::status::not_found;
        case core::ErrorCode::kRangeNotSatisfiable:
            return beast_http::status::range_not_satisfiable;
        case core::ErrorCode::kBusy:
        case core::ErrorCode::kUnavailable:
            return beast_http::status::service_unavailable;
        case core::ErrorCode::kTimeout:
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kCancelled:
        case core::ErrorCode::kInternal:
            return beast_http::status::internal_server_error;
    }
    return beast_http::status::internal_server_error;
}

std::string DefaultMessage(beast_http::status status) {
    switch (status) {
        case beast_http::status::bad_request:
            return "Invalid request.";
        case beast_http::status::unauthorized:
            return "File code is required to download the file.";
        case beast_http::status::forbidden:
            return "Invalid file code.";
        case beast_http::status::not_found:
            return "File not found.";
        case beast_http::status::range_not_satisfiable:
            return "Invalid range.";
        case beast_http::status::service_unavailable:
            return "Service temporarily unavailable.";
        default:
            return "Internal server error.";
    }
}

HttpResponse JsonResponse(beast_http::status status, unsigned version, const std::string& body) {
    HttpResponse response{status, version};
    response.set(beast_http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(beast_http::status status, unsigned version, const std::string& code,
                           const std::string& message, const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message.empty() ? DefaultMessage(status) : message);
    error->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);
    std::stringstream ss;
    root->stringify(ss);
    return JsonResponse(status, version, ss.str());
}

HttpResponse ErrorResponseFor(const core::Error& error, unsigned version,
                              const std::string& request_id) {
    const auto status = StatusFor(error.code);
    // Internal details stay in the logs; clients get the generic message for 5xx.
    const auto message = status == beast_http::status::internal_server_error
                             ? DefaultMessage(status)
                             : error.message;
    return ErrorResponse(status, version, core::ErrorCodeName(error.code), message, request_id);
}

}  // namespace filelink::http
