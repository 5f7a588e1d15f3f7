#include "sb/result.h"

namespace sb {

const char* toString(ResultError err) {
    switch (err) {
        case ResultError::OK:
            return "OK";
        case ResultError::UNKNOWN:
            return "UNKNOWN";
        case ResultError::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ResultError::OUT_OF_RANGE:
            return "OUT_OF_RANGE";
        case ResultError::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ResultError::IO_ERROR:
            return "IO_ERROR";
    }
    return "UNKNOWN";
}

} // namespace sb
