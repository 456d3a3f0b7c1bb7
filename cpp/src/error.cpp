#include "geoscan/error.hpp"

namespace geoscan {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CONFIGURATION:    return "CONFIGURATION";
        case ErrorCode::NO_PRECISION:     return "NO_PRECISION";
        case ErrorCode::IO_FAILURE:       return "IO_FAILURE";
        case ErrorCode::NOT_FOUND:        return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS:   return "ALREADY_EXISTS";
        case ErrorCode::CORRUPT_DATA:     return "CORRUPT_DATA";
    }
    return "UNKNOWN";
}

} // namespace geoscan
