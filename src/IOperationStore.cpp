#include "IOperationStore.hpp"

namespace darf {

bool OperationFilter::matches(const Operation& operation) const
{
    if (!assetCode.empty() && normalizeAssetCode(assetCode) != operation.assetCode) {
        return false;
    }
    if (assetType && *assetType != operation.assetType) {
        return false;
    }
    return true;
}

}  // namespace darf
