#include "errors.hpp"
#include <utility>

std::string error_kind_name(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::INVALID_FORMAT: return "InvalidFormat";
        case ErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorKind::OUT_OF_RANGE: return "OutOfRange";
        case ErrorKind::DUPLICATE_ENTITY: return "DuplicateEntity";
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::REFERENCED_ENTITY: return "ReferencedEntity";
        case ErrorKind::UNSUPPORTED_CAPABILITY: return "UnsupportedCapability";
        case ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS: return "MutuallyExclusiveParameters";
        case ErrorKind::MISSING_DEPENDENT_PARAMETERS: return "MissingDependentParameters";
        case ErrorKind::STORE_FAILURE: return "StoreFailure";
    }
    return "Unknown";
}

NetConfigError::NetConfigError(ErrorKind kind, const std::string& message,
                               std::vector<std::string> diagnostics)
    : std::runtime_error(message), error_kind(kind), diagnostic_items(std::move(diagnostics)) {}
