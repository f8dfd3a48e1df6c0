#include "filelink/core/error.h"

namespace filelink::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::kForbidden:
            return "FORBIDDEN";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kRangeNotSatisfiable:
            return "INVALID_RANGE";
        case ErrorCode::kBusy:
            return "BUSY";
        case ErrorCode::kUnavailable:
            return "UNAVAILABLE";
        case ErrorCode::kTimeout:
            return "TIMEOUT";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kCancelled:
            return "CANCELLED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace filelink::core
