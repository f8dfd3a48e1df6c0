#include "filelink/http/route_registration.h"

#include <cctype>
#include <sstream>
#include <string>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "filelink/core/logger.h"
#include "filelink/http/access_request.h"
#include "filelink/http/status_mapping.h"
#include "filelink/observability/metrics.h"
#include "filelink/registry/object_registry.h"

namespace filelink::http {
namespace {

namespace beast_http = boost::beast::http;

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::string ExtractBearerToken(const HttpRequest& request) {
    // Expect "Authorization: Bearer <token>".
    auto it = request.find(beast_http::field::authorization);
    if (it == request.end()) {
        return "";
    }
    std::string value = Trim(std::string(it->value()));
    if (value.size() < 7) {
        return "";
    }
    std::string prefix = value.substr(0, 7);
    for (auto& c : prefix) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (prefix != "bearer ") {
        return "";
    }
    return Trim(value.substr(7));
}

core::Result<registry::LinkRequest> ParseLinkRequest(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj) {
            return core::Error{core::ErrorCode::kInvalidArgument, "expected a JSON object"};
        }

        registry::LinkRequest request;
        request.source_object_id = obj->getValue<Poco::Int64>("source_id");
        request.issuer_id = obj->getValue<Poco::Int64>("issuer_id");
        request.size_bytes = obj->getValue<Poco::UInt64>("size");
        request.location = obj->optValue<std::string>("location", "");
        request.file_name = obj->optValue<std::string>("file_name", "");
        request.mime_type = obj->optValue<std::string>("mime_type", "");
        request.media_kind = obj->optValue<std::string>("media_kind", "");
        return request;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.what()};
    }
}

std::string ObjectUrl(const std::string& base_url, const std::string& route,
                      std::int64_t object_id, const std::string& code) {
    return base_url + "/" + route + "/" + std::to_string(object_id) +
           "?code=" + EncodeQueryValue(code);
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<registry::ObjectRegistry> registry,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id +
                                           "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ready\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain; version=0.0.4");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    if (!config.links.enabled) {
        return;
    }

    const auto admin_token = config.links.admin_token;
    router.Add("POST", "/v1/links",
               [registry, admin_token](const RequestContext& ctx, const HttpRequest& req,
                                       const RouteParams&) -> core::Result<HttpResponse> {
                   if (admin_token.empty() || ExtractBearerToken(req) != admin_token) {
                       return ErrorResponse(beast_http::status::unauthorized, req.version(),
                                            "UNAUTHORIZED", "missing or invalid admin token",
                                            ctx.request_id);
                   }

                   auto parsed = ParseLinkRequest(req.body());
                   if (!parsed.ok()) {
                       return ErrorResponse(beast_http::status::bad_request, req.version(),
                                            "INVALID_JSON", parsed.error().message,
                                            ctx.request_id);
                   }

                   auto record = registry->GetOrCreateLink(parsed.value());
                   if (!record.ok()) {
                       core::LogError("link creation failed: " + record.error().message);
                       return ErrorResponseFor(record.error(), req.version(), ctx.request_id);
                   }

                   const auto& created = record.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("object_id", static_cast<Poco::Int64>(created.object_id));
                   root->set("code", created.label);
                   root->set("download_url",
                             ObjectUrl(ctx.base_url, "dl", created.object_id, created.label));
                   root->set("stream_url",
                             ObjectUrl(ctx.base_url, "stream", created.object_id, created.label));
                   std::stringstream ss;
                   root->stringify(ss);
                   return JsonResponse(beast_http::status::ok, req.version(), ss.str());
               });
}

}  // namespace filelink::http
