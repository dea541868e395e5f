#include "sas/status.hpp"

namespace sas {

const char* to_string(Status s) {
    switch (s) {
        case Status::Ok:                    return "ok";
        case Status::InvalidArgument:       return "invalid_argument";
        case Status::Overflow:              return "overflow";
        case Status::DuplicateMeter:        return "duplicate_meter";
        case Status::ChecksumDigitOverflow: return "checksum_digit_overflow";
        case Status::CapacityExceeded:      return "capacity_exceeded";
        case Status::ParseError:            return "parse_error";
        case Status::NotFound:              return "not_found";
    }
    return "unknown";
}

} // namespace sas
