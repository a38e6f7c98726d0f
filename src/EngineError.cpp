#include "EngineError.hpp"
#include <sstream>

namespace darf {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::ValidationError:      return "ValidationError";
        case ErrorCode::InsufficientPosition: return "InsufficientPosition";
        case ErrorCode::OrderingViolation:    return "OrderingViolation";
        case ErrorCode::ConfigurationError:   return "ConfigurationError";
        case ErrorCode::StorageError:         return "StorageError";
    }
    return "UnknownError";
}

std::string EngineError::describe() const
{
    std::ostringstream oss;
    oss << toString(code) << ": " << message;
    if (!operationId.empty()) {
        oss << " (operation " << operationId << ")";
    }
    return oss.str();
}

}  // namespace darf
