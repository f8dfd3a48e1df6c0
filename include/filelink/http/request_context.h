#pragma once

#include <string>

namespace filelink::http {

/// @brief Per-request metadata used for logging and error responses.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    /// Scheme and host the client reached us on, e.g. `https://files.example.com`.
    std::string base_url;
};

}  // namespace filelink::http
