#include "filelink/http/content_disposition.h"

#include <Poco/URI.h>

namespace filelink::http {

std::string AttachmentDisposition(const std::string& file_name) {
    // Everything outside RFC 5987 attr-char is percent-encoded as UTF-8.
    std::string name;
    Poco::URI::encode(file_name, " \"%'()*,/:;<=>?@[\\]{}", name);
    return "attachment; filename*=UTF-8''" + name;
}

}  // namespace filelink::http
