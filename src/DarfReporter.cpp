#include "DarfReporter.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace darf {

DarfReporter::DarfReporter(std::shared_ptr<const std::vector<TaxComputation>> computations)
    : computations_(std::move(computations))
{
}

std::expected<DarfReport, EngineError> DarfReporter::query(int year, int month) const
{
    YearMonth period{year, month};
    if (!period.valid()) {
        return makeError(ErrorCode::ValidationError,
            "Month must be between 1 and 12, got " + std::to_string(month));
    }

    return collect(period);
}

std::vector<DarfReport> DarfReporter::queryYear(int year) const
{
    std::vector<DarfReport> reports;

    for (const auto& period : months()) {
        if (period.year == year) {
            reports.push_back(collect(period));
        }
    }

    return reports;
}

std::vector<YearMonth> DarfReporter::months() const
{
    if (!computations_) {
        return {};
    }

    std::set<YearMonth> periods;
    for (const auto& computation : *computations_) {
        periods.insert(computation.key.period);
    }

    return {periods.begin(), periods.end()};
}

DarfReport DarfReporter::collect(const YearMonth& period) const
{
    DarfReport report;
    report.period = period;

    if (!computations_) {
        return report;
    }

    for (const auto& computation : *computations_) {
        if (computation.key.period == period) {
            report.items.push_back(computation);
            report.totalDue += computation.netTaxDue;
        }
    }

    // Стабильный порядок строк независимо от порядка свертки
    std::sort(report.items.begin(), report.items.end(),
        [](const TaxComputation& a, const TaxComputation& b) {
            return a.key < b.key;
        });

    return report;
}

}  // namespace darf
