#include "pathgate/core/error.h"

namespace pathgate::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kPathTraversal:
            return "PATH_TRAVERSAL";
        case ErrorCode::kPrefixViolation:
            return "PATH_NOT_ALLOWED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace pathgate::core
