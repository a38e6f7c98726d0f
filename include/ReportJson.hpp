#pragma once

#include "Operation.hpp"
#include "PositionTracker.hpp"
#include "TaxRuleEngine.hpp"
#include "DarfReporter.hpp"
#include "PortfolioSummary.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <vector>

namespace darf {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// JSON-представление (имена полей в snake_case, перечисления - канонические
// строки: acao, swing_trade, compra, ...)
// ═══════════════════════════════════════════════════════════════════════════════

json operationToJson(const Operation& operation);
json realizedToJson(const RealizedResult& realized);
json positionToJson(const Position& position);
json computationToJson(const TaxComputation& computation);
json reportToJson(const DarfReport& report);
json summaryToJson(const PortfolioSummary& summary);

// Обязательные: asset_code, asset_type, trade_category, operation_type,
// quantity, unit_price, operation_date. total_cost по умолчанию
// quantity * unit_price, id и ir_retained необязательны.
std::expected<Operation, std::string> operationFromJson(const json& j);

// Объект - одна операция, массив - несколько
std::expected<std::vector<Operation>, std::string> operationsFromJson(const json& j);

}  // namespace darf
