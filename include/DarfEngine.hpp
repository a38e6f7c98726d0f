#pragma once

#include "PositionTracker.hpp"
#include "MonthlyAggregator.hpp"
#include "TaxRuleEngine.hpp"
#include "DarfReporter.hpp"
#include "IOperationStore.hpp"
#include <memory>
#include <mutex>
#include <vector>
#include <expected>

namespace darf {

// Снимок одного полного пересчета. После публикации не изменяется.
struct PublishedResult {
    RecomputeResult recompute;
    std::vector<MonthlyBucket> buckets;
    TaxComputationSet taxes;
};

// ═══════════════════════════════════════════════════════════════════════════════
// DarfEngine - конвейер пересчет -> агрегация -> налоги -> публикация
// ═══════════════════════════════════════════════════════════════════════════════
//
// Каждый run строит новый снимок и заменяет опубликованный целиком.
// Читатели держат shared_ptr на свой снимок и никогда не видят
// частично пересчитанное состояние. При ошибке публикация не меняется.

class DarfEngine {
public:
    explicit DarfEngine(std::shared_ptr<const TaxRuleSchedule> schedule);

    DarfEngine(const DarfEngine&) = delete;
    DarfEngine& operator=(const DarfEngine&) = delete;

    // Отдельные этапы (без публикации)
    std::expected<RecomputeResult, EngineError> recompute(
        const std::vector<Operation>& operations) const;

    std::vector<MonthlyBucket> aggregate(const RecomputeResult& recomputed) const;

    std::expected<TaxComputationSet, EngineError> computeTaxes(
        const std::vector<MonthlyBucket>& buckets) const;

    // Полный пересчет с публикацией результата
    std::expected<std::shared_ptr<const PublishedResult>, EngineError> run(
        const std::vector<Operation>& operations);

    // То же по всей истории хранилища; ошибки хранилища -> StorageError
    std::expected<std::shared_ptr<const PublishedResult>, EngineError> runFromStore(
        IOperationStore& store);

    // nullptr, пока ничего не опубликовано
    std::shared_ptr<const PublishedResult> published() const;

    // Reporter над текущим снимком
    DarfReporter reporter() const;

    // Пустой отчет, если ничего не опубликовано
    std::expected<DarfReport, EngineError> query(int year, int month) const;


private:
    std::shared_ptr<const TaxRuleSchedule> schedule_;
    PositionTracker tracker_;
    TaxRuleEngine ruleEngine_;

    mutable std::mutex mutex_;
    std::shared_ptr<const PublishedResult> published_;
};

}  // namespace darf
