#include "ticket_types.hpp"

namespace tickets {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::none:                return "none";
        case ErrorCode::configuration_error: return "configuration_error";
        case ErrorCode::service_not_open:    return "service_not_open";
        case ErrorCode::validation_error:    return "validation_error";
        case ErrorCode::not_allocated:       return "not_allocated";
        case ErrorCode::not_entitled:        return "not_entitled";
        case ErrorCode::already_exchanged:   return "already_exchanged";
        case ErrorCode::out_of_goods:        return "out_of_goods";
        case ErrorCode::exhausted_source:    return "exhausted_source";
    }
    return "unknown";
}

} // namespace tickets
