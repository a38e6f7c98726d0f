#include "MonthlyAggregator.hpp"
#include <map>

namespace darf {

std::vector<MonthlyBucket> MonthlyAggregator::aggregate(
    const std::vector<RealizedResult>& realized)
{
    std::map<BucketKey, MonthlyBucket> grouped;

    for (const auto& sale : realized) {
        BucketKey key{YearMonth::of(sale.operationDate), sale.assetType, sale.tradeCategory};

        auto& bucket = grouped[key];
        bucket.key = key;
        bucket.totalSales += sale.proceeds;
        bucket.netResult += sale.gainLoss;
        bucket.irRetainedTotal += sale.irRetained;
        ++bucket.sellCount;
    }

    std::vector<MonthlyBucket> buckets;
    buckets.reserve(grouped.size());
    for (auto& [key, bucket] : grouped) {
        buckets.push_back(bucket);
    }

    return buckets;
}

}  // namespace darf
