#include "filelink/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace filelink::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace filelink::core
