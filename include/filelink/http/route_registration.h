#pragma once

#include <memory>

#include "filelink/core/config.h"
#include "filelink/http/router.h"

namespace filelink::registry {
class ObjectRegistry;
}

namespace filelink::http {

/// Registers health, metrics and link-issuing routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<registry::ObjectRegistry> registry,
                           const core::Config& config);

}  // namespace filelink::http
