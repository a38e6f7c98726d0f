#include "OperationValidator.hpp"
#include <cmath>
#include <utility>

namespace darf {

namespace {

bool isKnown(AssetType type) noexcept
{
    return toString(type) != "unknown";
}

bool isKnown(TradeCategory category) noexcept
{
    return toString(category) != "unknown";
}

bool isKnown(OperationType type) noexcept
{
    return toString(type) != "unknown";
}

}  // namespace

Result validateOperation(const Operation& operation)
{
    const auto& id = operation.id;

    if (normalizeAssetCode(operation.assetCode).empty()) {
        return makeError(ErrorCode::ValidationError, "Asset code cannot be empty", id);
    }

    if (!isKnown(operation.assetType)) {
        return makeError(ErrorCode::ValidationError, "Unknown asset type", id);
    }

    if (!isKnown(operation.tradeCategory)) {
        return makeError(ErrorCode::ValidationError, "Unknown trade category", id);
    }

    if (!isKnown(operation.operationType)) {
        return makeError(ErrorCode::ValidationError, "Unknown operation type", id);
    }

    if (!std::isfinite(operation.quantity) || operation.quantity <= 0.0) {
        return makeError(ErrorCode::ValidationError, "Quantity must be positive", id);
    }

    if (!std::isfinite(operation.unitPrice) || operation.unitPrice <= 0.0) {
        return makeError(ErrorCode::ValidationError, "Unit price must be positive", id);
    }

    if (!std::isfinite(operation.totalCost) || operation.totalCost < 0.0) {
        return makeError(ErrorCode::ValidationError, "Total cost cannot be negative", id);
    }

    if (!operation.operationDate.ok()) {
        return makeError(ErrorCode::ValidationError, "Invalid operation date", id);
    }

    if (operation.irRetained &&
        (!std::isfinite(*operation.irRetained) || *operation.irRetained < 0.0)) {
        return makeError(ErrorCode::ValidationError, "Retained tax cannot be negative", id);
    }

    return {};
}

std::vector<Operation> filterValidOperations(
    const std::vector<Operation>& operations,
    ValidationReport& report)
{
    std::vector<Operation> valid;
    valid.reserve(operations.size());

    for (const auto& operation : operations) {
        auto check = validateOperation(operation);
        if (!check) {
            report.rejected.push_back(check.error());
            continue;
        }

        Operation normalized = operation;
        normalized.assetCode = normalizeAssetCode(operation.assetCode);
        valid.push_back(std::move(normalized));
    }

    return valid;
}

}  // namespace darf
