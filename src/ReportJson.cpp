#include "ReportJson.hpp"

namespace darf {

json operationToJson(const Operation& operation)
{
    json j;
    j["id"] = operation.id;
    j["asset_code"] = operation.assetCode;
    j["asset_type"] = std::string(toString(operation.assetType));
    j["trade_category"] = std::string(toString(operation.tradeCategory));
    j["operation_type"] = std::string(toString(operation.operationType));
    j["quantity"] = operation.quantity;
    j["unit_price"] = operation.unitPrice;
    j["total_cost"] = operation.totalCost;
    j["operation_date"] = formatDate(operation.operationDate);

    if (operation.irRetained) {
        j["ir_retained"] = *operation.irRetained;
    } else {
        j["ir_retained"] = nullptr;
    }

    return j;
}

json realizedToJson(const RealizedResult& realized)
{
    json j;
    j["operation_id"] = realized.operationId;
    j["asset_code"] = realized.assetCode;
    j["asset_type"] = std::string(toString(realized.assetType));
    j["trade_category"] = std::string(toString(realized.tradeCategory));
    j["operation_date"] = formatDate(realized.operationDate);
    j["quantity"] = realized.quantity;
    j["proceeds"] = realized.proceeds;
    j["cost_basis_consumed"] = realized.costBasisConsumed;
    j["gain_loss"] = realized.gainLoss;
    j["ir_retained"] = realized.irRetained;
    return j;
}

json positionToJson(const Position& position)
{
    json j;
    j["asset_code"] = position.assetCode;
    j["asset_type"] = std::string(toString(position.assetType));
    j["quantity"] = position.heldQuantity;
    j["average_unit_cost"] = position.averageUnitCost;
    j["total_invested"] = position.totalInvested;
    j["realized_gain_loss"] = position.realizedGainLoss;
    return j;
}

json computationToJson(const TaxComputation& computation)
{
    json j;
    j["year"] = computation.year();
    j["month"] = computation.month();
    j["asset_type"] = std::string(toString(computation.assetType()));
    j["trade_category"] = std::string(toString(computation.tradeCategory()));
    j["total_sales"] = computation.totalSales;
    j["net_result"] = computation.netResult;
    j["taxable_profit"] = computation.taxableProfit;
    j["tax_rate"] = computation.taxRate;
    j["tax_due"] = computation.taxDue;
    j["ir_retained"] = computation.irRetained;
    j["net_tax_due"] = computation.netTaxDue;
    j["exemption_applied"] = computation.exemptionApplied;
    j["loss_carry_consumed"] = computation.lossCarryConsumed;
    j["loss_carry_remaining"] = computation.lossCarryRemaining;
    return j;
}

json reportToJson(const DarfReport& report)
{
    json j;
    j["year"] = report.period.year;
    j["month"] = report.period.month;

    json items = json::array();
    for (const auto& item : report.items) {
        items.push_back(computationToJson(item));
    }
    j["items"] = items;
    j["total_due"] = report.totalDue;

    return j;
}

json summaryToJson(const PortfolioSummary& summary)
{
    json j;
    j["total_invested"] = summary.totalInvested;
    j["total_current_value"] = summary.totalCurrentValue;
    j["total_profit_loss"] = summary.totalProfitLoss;
    j["profit_loss_percentage"] = summary.profitLossPercentage;
    j["open_positions"] = summary.openPositions;
    j["assets_distribution"] = summary.assetsDistribution;
    return j;
}

std::expected<Operation, std::string> operationFromJson(const json& j)
{
    try {
        Operation operation;
        operation.id = j.value("id", "");
        operation.assetCode = j.at("asset_code").get<std::string>();

        auto assetType = parseAssetType(j.at("asset_type").get<std::string>());
        if (!assetType) {
            return std::unexpected(assetType.error());
        }
        operation.assetType = *assetType;

        auto category = parseTradeCategory(j.at("trade_category").get<std::string>());
        if (!category) {
            return std::unexpected(category.error());
        }
        operation.tradeCategory = *category;

        auto operationType = parseOperationType(j.at("operation_type").get<std::string>());
        if (!operationType) {
            return std::unexpected(operationType.error());
        }
        operation.operationType = *operationType;

        operation.quantity = j.at("quantity").get<double>();
        operation.unitPrice = j.at("unit_price").get<double>();
        operation.totalCost = j.value("total_cost", operation.quantity * operation.unitPrice);

        auto date = parseDate(j.at("operation_date").get<std::string>());
        if (!date) {
            return std::unexpected(date.error());
        }
        operation.operationDate = *date;

        if (j.contains("ir_retained") && !j.at("ir_retained").is_null()) {
            operation.irRetained = j.at("ir_retained").get<double>();
        }

        return operation;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Deserialization error: ") + e.what());
    }
}

std::expected<std::vector<Operation>, std::string> operationsFromJson(const json& j)
{
    std::vector<Operation> operations;

    if (!j.is_array()) {
        auto operation = operationFromJson(j);
        if (!operation) {
            return std::unexpected(operation.error());
        }
        operations.push_back(std::move(*operation));
        return operations;
    }

    for (std::size_t i = 0; i < j.size(); ++i) {
        auto operation = operationFromJson(j[i]);
        if (!operation) {
            return std::unexpected("Element " + std::to_string(i) + ": " + operation.error());
        }
        operations.push_back(std::move(*operation));
    }

    return operations;
}

}  // namespace darf
