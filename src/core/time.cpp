#include "filelink/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

namespace filelink::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string NowFormatted(const std::string& pattern) {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), pattern);
}

}  // namespace filelink::core
