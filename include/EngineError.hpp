#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Классификация ошибок движка
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorCode {
    ValidationError,       // некорректная операция, исключается из пересчета
    InsufficientPosition,  // продажа больше позиции, пересчет прерывается
    OrderingViolation,     // месяцы линии обработаны не по порядку
    ConfigurationError,    // нет ставки / правил для периода
    StorageError           // ошибка хранилища операций
};

std::string_view toString(ErrorCode code) noexcept;

struct EngineError {
    ErrorCode code = ErrorCode::ValidationError;
    std::string message;
    std::string operationId;  // пусто, если ошибка не относится к операции

    // "InsufficientPosition: ... (operation 42)"
    std::string describe() const;
};

inline std::unexpected<EngineError> makeError(
    ErrorCode code,
    std::string message,
    std::string operationId = "")
{
    return std::unexpected(EngineError{code, std::move(message), std::move(operationId)});
}

using Result = std::expected<void, EngineError>;

}  // namespace darf
