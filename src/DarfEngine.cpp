#include "DarfEngine.hpp"
#include <stdexcept>
#include <utility>

namespace darf {

DarfEngine::DarfEngine(std::shared_ptr<const TaxRuleSchedule> schedule)
    : schedule_(std::move(schedule))
    , tracker_(schedule_)
    , ruleEngine_(schedule_)
{
    if (!schedule_) {
        throw std::invalid_argument("DarfEngine requires a tax rule schedule");
    }
}

std::expected<RecomputeResult, EngineError> DarfEngine::recompute(
    const std::vector<Operation>& operations) const
{
    return tracker_.recompute(operations);
}

std::vector<MonthlyBucket> DarfEngine::aggregate(const RecomputeResult& recomputed) const
{
    return MonthlyAggregator::aggregate(recomputed.realized);
}

std::expected<TaxComputationSet, EngineError> DarfEngine::computeTaxes(
    const std::vector<MonthlyBucket>& buckets) const
{
    return ruleEngine_.computeTaxes(buckets);
}

std::expected<std::shared_ptr<const PublishedResult>, EngineError> DarfEngine::run(
    const std::vector<Operation>& operations)
{
    auto recomputed = recompute(operations);
    if (!recomputed) {
        return std::unexpected(recomputed.error());
    }

    auto buckets = aggregate(*recomputed);

    auto taxes = computeTaxes(buckets);
    if (!taxes) {
        return std::unexpected(taxes.error());
    }

    auto result = std::make_shared<PublishedResult>();
    result->recompute = std::move(*recomputed);
    result->buckets = std::move(buckets);
    result->taxes = std::move(*taxes);

    std::shared_ptr<const PublishedResult> snapshot = std::move(result);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_ = snapshot;
    }

    return snapshot;
}

std::expected<std::shared_ptr<const PublishedResult>, EngineError> DarfEngine::runFromStore(
    IOperationStore& store)
{
    auto operations = store.list();
    if (!operations) {
        return makeError(ErrorCode::StorageError,
                         "Failed to load operations: " + operations.error());
    }

    return run(*operations);
}

std::shared_ptr<const PublishedResult> DarfEngine::published() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

DarfReporter DarfEngine::reporter() const
{
    auto snapshot = published();
    if (!snapshot) {
        return DarfReporter();
    }

    // Reporter держит весь снимок, пока смотрит на его расчеты
    return DarfReporter(std::shared_ptr<const std::vector<TaxComputation>>(
        snapshot, &snapshot->taxes.computations));
}

std::expected<DarfReport, EngineError> DarfEngine::query(int year, int month) const
{
    return reporter().query(year, month);
}

}  // namespace darf
