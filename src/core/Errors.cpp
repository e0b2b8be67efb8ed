#include "core/Errors.hpp"

namespace devmonitor::core {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::DuplicateDevice:
        return "DuplicateDeviceError";
    case ErrorKind::NotFound:
        return "NotFoundError";
    case ErrorKind::Persistence:
        return "PersistenceError";
    }
    return "UnknownError";
}

} // namespace devmonitor::core
