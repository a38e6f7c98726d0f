#include "CommandExecutor.hpp"
#include "SQLiteOperationStore.hpp"
#include "OperationCsvReader.hpp"
#include "OperationValidator.hpp"
#include "PortfolioSummary.hpp"
#include "ReportJson.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

namespace darf {

CommandExecutor::CommandExecutor(
    std::shared_ptr<IOperationStore> store,
    std::shared_ptr<const TaxRuleSchedule> schedule)
    : store_(std::move(store))
    , schedule_(std::move(schedule))
{
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация хранилища и правил
// ═════════════════════════════════════════════════════════════════════════════

std::filesystem::path CommandExecutor::defaultDatabasePath()
{
    if (const char* envPath = std::getenv("DARF_DB_PATH")) {
        return envPath;
    }

    // Используем директорию пользователя по умолчанию
    const char* homeDir = std::getenv("HOME");
    if (!homeDir) {
        homeDir = ".";
    }
    return std::filesystem::path(homeDir) / ".darf" / "operations.db";
}

std::filesystem::path CommandExecutor::defaultConfigPath()
{
    if (const char* envPath = std::getenv("DARF_CONFIG")) {
        return envPath;
    }
    return std::filesystem::path("config") / "tax_rules.conf";
}

std::expected<void, std::string> CommandExecutor::ensureStore(const ParsedCommand& cmd)
{
    if (store_) {
        return {};
    }

    std::filesystem::path dbPath = defaultDatabasePath();
    if (cmd.options.count("db-path")) {
        dbPath = cmd.options.at("db-path").as<std::string>();
    }

    auto store = SQLiteOperationStore::open(dbPath.string());
    if (!store) {
        return std::unexpected(store.error());
    }

    store_ = std::move(*store);
    return {};
}

std::expected<void, std::string> CommandExecutor::ensureSchedule(const ParsedCommand& cmd)
{
    if (schedule_) {
        return {};
    }

    std::filesystem::path configPath = defaultConfigPath();
    if (cmd.options.count("config")) {
        configPath = cmd.options.at("config").as<std::string>();
    }

    auto schedule = TaxRuleSchedule::loadFromFile(configPath);
    if (!schedule) {
        return std::unexpected(schedule.error().describe());
    }

    schedule_ = std::make_shared<const TaxRuleSchedule>(std::move(*schedule));
    return {};
}

std::expected<std::shared_ptr<const PublishedResult>, std::string> CommandExecutor::runEngine(
    const ParsedCommand& cmd)
{
    auto storeResult = ensureStore(cmd);
    if (!storeResult) {
        return std::unexpected(storeResult.error());
    }

    auto scheduleResult = ensureSchedule(cmd);
    if (!scheduleResult) {
        return std::unexpected(scheduleResult.error());
    }

    if (!engine_) {
        engine_ = std::make_unique<DarfEngine>(schedule_);
    }

    auto result = engine_->runFromStore(*store_);
    if (!result) {
        return std::unexpected(result.error().describe());
    }

    printWarnings((*result)->recompute.rejected);
    return *result;
}

// ═════════════════════════════════════════════════════════════════════════════
// Маршрутизация команд
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "operation") {
        return executeOperation(cmd);
    } else if (cmd.command == "darf") {
        return executeDarf(cmd);
    } else if (cmd.command == "portfolio") {
        return executePortfolio(cmd);
    } else if (cmd.command == "assets") {
        return executeAssets(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "DARF - monthly capital gains tax calculator" << std::endl;
        std::cout << "Usage: darf <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  operation               Manage buy/sell operations" << std::endl;
        std::cout << "  darf                    Monthly DARF report" << std::endl;
        std::cout << "  portfolio summary       Portfolio summary at cost" << std::endl;
        std::cout << "  assets types            Supported asset types and categories" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "COMMON OPTIONS:" << std::endl;
        std::cout << "  --db-path PATH          SQLite file (env DARF_DB_PATH)" << std::endl;
        std::cout << "  --config PATH           Tax rules file (env DARF_CONFIG)" << std::endl;
        std::cout << std::endl;

        std::cout << "For more information on a specific command, use:" << std::endl;
        std::cout << "  darf help <command>" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "operation") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: operation" << std::endl;
        std::cout << "Manage the operation history" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "SUBCOMMANDS:" << std::endl;
        std::cout << "  add      Register an operation" << std::endl;
        std::cout << "  list     List operations" << std::endl;
        std::cout << "  delete   Delete an operation by id" << std::endl;
        std::cout << "  import   Import operations from CSV or JSON" << std::endl;
        std::cout << std::endl;

        std::cout << "ADD OPTIONS:" << std::endl;
        std::cout << "  -a, --asset-code CODE   Asset code (e.g., PETR4)" << std::endl;
        std::cout << "  --asset-type TYPE       acao, etf, fii, bdr, opcao, cripto" << std::endl;
        std::cout << "  -c, --category CAT      swing_trade (default), day_trade" << std::endl;
        std::cout << "  -t, --type TYPE         compra, venda" << std::endl;
        std::cout << "  -q, --quantity NUM      Quantity" << std::endl;
        std::cout << "  -p, --price NUM         Unit price" << std::endl;
        std::cout << "  --total-cost NUM        Total with fees (default: quantity * price)" << std::endl;
        std::cout << "  -d, --date DATE         YYYY-MM-DD" << std::endl;
        std::cout << "  --ir-retained NUM       Tax withheld at source" << std::endl;
        std::cout << std::endl;

        std::cout << "LIST OPTIONS:" << std::endl;
        std::cout << "  -a, --asset-code CODE   Filter by asset code" << std::endl;
        std::cout << "  --asset-type TYPE       Filter by asset type" << std::endl;
        std::cout << "  --format FORMAT         text (default), json" << std::endl;
        std::cout << std::endl;

        std::cout << "IMPORT OPTIONS:" << std::endl;
        std::cout << "  -f, --file FILE         CSV (header row) or .json file" << std::endl;
        std::cout << "  --delimiter CHAR        CSV delimiter (default: ',')" << std::endl;
        std::cout << std::endl;

        std::cout << "EXAMPLES:" << std::endl;
        std::cout << "  darf operation add -a PETR4 --asset-type acao -t compra \\" << std::endl;
        std::cout << "    -q 100 -p 25.50 --total-cost 2555 -d 2024-01-15" << std::endl;
        std::cout << "  darf operation list -a PETR4" << std::endl;
        std::cout << "  darf operation import -f operations.csv" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "darf") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: darf" << std::endl;
        std::cout << "Tax due per month, asset type and trade category" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "OPTIONS:" << std::endl;
        std::cout << "  -y, --year YEAR         Year (required)" << std::endl;
        std::cout << "  -m, --month MONTH       Month 1-12; all months of the year if omitted" << std::endl;
        std::cout << "  --format FORMAT         text (default), json" << std::endl;
        std::cout << std::endl;

        std::cout << "EXAMPLES:" << std::endl;
        std::cout << "  darf darf --year 2024 --month 3" << std::endl;
        std::cout << "  darf darf -y 2024 --format json" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "portfolio") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: portfolio summary" << std::endl;
        std::cout << "Invested amount, open positions at cost and realized result" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "OPTIONS:" << std::endl;
        std::cout << "  --format FORMAT         text (default), json" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "assets") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: assets types" << std::endl;
        std::cout << "Supported asset types, trade categories and configured rates" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else {
        std::cout << "Unknown help topic: " << topic << std::endl;
        std::cout << "Available topics: operation, darf, portfolio, assets" << std::endl;
    }

    std::cout << std::endl;
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "DARF - monthly capital gains tax calculator" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Operation Management
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeOperation(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'darf help operation' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "add") {
        return executeOperationAdd(cmd);
    } else if (cmd.subcommand == "list") {
        return executeOperationList(cmd);
    } else if (cmd.subcommand == "delete") {
        return executeOperationDelete(cmd);
    } else if (cmd.subcommand == "import") {
        return executeOperationImport(cmd);
    } else {
        return std::unexpected("Unknown operation subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executeOperationAdd(const ParsedCommand& cmd)
{
    auto operation = buildOperation(cmd);
    if (!operation) {
        return std::unexpected(operation.error());
    }

    auto valid = validateOperation(*operation);
    if (!valid) {
        return std::unexpected(valid.error().describe());
    }

    auto stored = storeOperations(cmd, {*operation});
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (*stored == 0) {
        return std::unexpected("Operation was not saved");
    }

    std::ostringstream price;
    price << std::fixed << std::setprecision(2) << operation->unitPrice;

    std::cout << "✓ Operation added: " << normalizeAssetCode(operation->assetCode) << " "
              << toString(operation->operationType) << " " << operation->quantity
              << " @ " << price.str()
              << " on " << formatDate(operation->operationDate) << std::endl;

    return {};
}

std::expected<void, std::string> CommandExecutor::executeOperationList(const ParsedCommand& cmd)
{
    auto storeResult = ensureStore(cmd);
    if (!storeResult) {
        return storeResult;
    }

    auto asJson = wantsJson(cmd);
    if (!asJson) {
        return std::unexpected(asJson.error());
    }

    OperationFilter filter;
    if (cmd.options.count("asset-code")) {
        filter.assetCode = cmd.options.at("asset-code").as<std::string>();
    }
    if (cmd.options.count("asset-type")) {
        auto type = parseAssetType(cmd.options.at("asset-type").as<std::string>());
        if (!type) {
            return std::unexpected(type.error());
        }
        filter.assetType = *type;
    }

    auto operations = store_->list(filter);
    if (!operations) {
        return std::unexpected(operations.error());
    }

    if (*asJson) {
        json j = json::array();
        for (const auto& operation : *operations) {
            j.push_back(operationToJson(operation));
        }
        std::cout << j.dump(2) << std::endl;
        return {};
    }

    if (operations->empty()) {
        std::cout << "No operations found." << std::endl;
        return {};
    }

    std::cout << "Operations (" << operations->size() << "):" << std::endl;
    printOperations(*operations);
    return {};
}

std::expected<void, std::string> CommandExecutor::executeOperationDelete(const ParsedCommand& cmd)
{
    auto idResult = getRequiredOption<std::string>(cmd, "id");
    if (!idResult) {
        return std::unexpected(idResult.error());
    }

    auto storeResult = ensureStore(cmd);
    if (!storeResult) {
        return storeResult;
    }

    auto operation = store_->get(*idResult);
    if (!operation) {
        return std::unexpected(operation.error());
    }

    auto removed = store_->remove(*idResult);
    if (!removed) {
        return std::unexpected(removed.error());
    }

    // Удаление покупки может оставить позднюю продажу без позиции
    auto checked = checkHistory();
    if (!checked) {
        auto restored = store_->add(*operation);
        if (!restored) {
            return std::unexpected(checked.error().describe() +
                                   "; failed to restore operation: " + restored.error());
        }
        return std::unexpected(checked.error().describe());
    }

    std::cout << "✓ Operation deleted: " << *idResult << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executeOperationImport(const ParsedCommand& cmd)
{
    auto fileResult = getRequiredOption<std::string>(cmd, "file");
    if (!fileResult) {
        return std::unexpected(fileResult.error());
    }

    const std::filesystem::path filePath(*fileResult);
    std::vector<Operation> parsed;
    std::size_t skipped = 0;

    if (filePath.extension() == ".json") {
        std::ifstream file(filePath);
        if (!file) {
            return std::unexpected("Failed to open file: " + filePath.string());
        }

        json j = json::parse(file, nullptr, false);
        if (j.is_discarded()) {
            return std::unexpected("Invalid JSON in file: " + filePath.string());
        }

        auto operations = operationsFromJson(j);
        if (!operations) {
            return std::unexpected(operations.error());
        }
        parsed = std::move(*operations);
    } else {
        char delimiter = cmd.options.count("delimiter")
            ? cmd.options.at("delimiter").as<char>()
            : ',';

        OperationCsvReader reader(nullptr, delimiter);
        auto imported = reader.read(filePath.string());
        if (!imported) {
            return std::unexpected(imported.error());
        }

        for (const auto& error : imported->errors) {
            std::cerr << "Warning: line " << error.lineNumber << ": "
                      << error.message << std::endl;
        }
        skipped += imported->errors.size();
        parsed = std::move(imported->operations);
    }

    ValidationReport report;
    auto valid = filterValidOperations(parsed, report);
    printWarnings(report);
    skipped += report.size();

    auto stored = storeOperations(cmd, valid);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    skipped += valid.size() - *stored;

    std::cout << "✓ Imported " << *stored << " operation(s)";
    if (skipped > 0) {
        std::cout << ", skipped " << skipped;
    }
    std::cout << std::endl;

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// DARF
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeDarf(const ParsedCommand& cmd)
{
    auto yearResult = getRequiredOption<int>(cmd, "year");
    if (!yearResult) {
        return std::unexpected(yearResult.error());
    }

    auto asJson = wantsJson(cmd);
    if (!asJson) {
        return std::unexpected(asJson.error());
    }

    auto published = runEngine(cmd);
    if (!published) {
        return std::unexpected(published.error());
    }

    const auto reporter = engine_->reporter();

    std::vector<DarfReport> reports;
    if (cmd.options.count("month")) {
        auto report = reporter.query(*yearResult, cmd.options.at("month").as<int>());
        if (!report) {
            return std::unexpected(report.error().describe());
        }
        reports.push_back(std::move(*report));
    } else {
        reports = reporter.queryYear(*yearResult);
    }

    if (*asJson) {
        if (cmd.options.count("month")) {
            std::cout << reportToJson(reports.front()).dump(2) << std::endl;
        } else {
            json j = json::array();
            for (const auto& report : reports) {
                j.push_back(reportToJson(report));
            }
            std::cout << j.dump(2) << std::endl;
        }
        return {};
    }

    if (reports.empty()) {
        std::cout << "No taxable sales in " << *yearResult << "." << std::endl;
        return {};
    }

    for (const auto& report : reports) {
        printReport(report);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Portfolio
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executePortfolio(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'darf help portfolio' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "summary") {
        return executePortfolioSummary(cmd);
    } else {
        return std::unexpected("Unknown portfolio subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executePortfolioSummary(
    const ParsedCommand& cmd)
{
    auto asJson = wantsJson(cmd);
    if (!asJson) {
        return std::unexpected(asJson.error());
    }

    auto published = runEngine(cmd);
    if (!published) {
        return std::unexpected(published.error());
    }

    const auto summary = summarizePortfolio((*published)->recompute);

    if (*asJson) {
        json j = summaryToJson(summary);

        json positions = json::array();
        for (const auto& [code, position] : (*published)->recompute.positions) {
            if (position.isOpen()) {
                positions.push_back(positionToJson(position));
            }
        }
        j["positions"] = positions;

        json realized = json::array();
        for (const auto& sale : (*published)->recompute.realized) {
            realized.push_back(realizedToJson(sale));
        }
        j["realized"] = realized;

        std::cout << j.dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "PORTFOLIO SUMMARY" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Total invested:       " << summary.totalInvested << std::endl;
    std::cout << "Open positions value: " << summary.totalCurrentValue << " (at cost)" << std::endl;
    std::cout << "Realized result:      " << summary.totalProfitLoss
              << " (" << summary.profitLossPercentage << "%)" << std::endl;

    if (!summary.assetsDistribution.empty()) {
        std::cout << "\n" << std::string(70, '-') << std::endl;
        std::cout << "OPEN POSITIONS:" << std::endl;
        std::cout << std::string(70, '-') << std::endl;

        for (const auto& [code, value] : summary.assetsDistribution) {
            const auto& position = (*published)->recompute.positions.at(code);
            std::cout << "  " << std::left << std::setw(10) << code << std::right
                      << std::setw(8) << toString(position.assetType)
                      << std::setw(14) << std::setprecision(4) << position.heldQuantity
                      << std::setw(14) << std::setprecision(2) << position.averageUnitCost
                      << std::setw(16) << value << std::endl;
        }
    }

    std::cout << std::string(70, '=') << "\n" << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Assets
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeAssets(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty() || cmd.subcommand == "types") {
        return executeAssetsTypes(cmd);
    }
    return std::unexpected("Unknown assets subcommand: " + cmd.subcommand);
}

std::expected<void, std::string> CommandExecutor::executeAssetsTypes(const ParsedCommand& cmd)
{
    auto asJson = wantsJson(cmd);
    if (!asJson) {
        return std::unexpected(asJson.error());
    }

    if (*asJson) {
        json j;
        json types = json::array();
        for (auto type : kAllAssetTypes) {
            types.push_back(std::string(toString(type)));
        }
        json categories = json::array();
        for (auto category : kAllTradeCategories) {
            categories.push_back(std::string(toString(category)));
        }
        j["asset_types"] = types;
        j["trade_categories"] = categories;
        std::cout << j.dump(2) << std::endl;
        return {};
    }

    std::cout << "Asset types:" << std::endl;
    for (auto type : kAllAssetTypes) {
        std::cout << "  - " << toString(type) << std::endl;
    }

    std::cout << "Trade categories:" << std::endl;
    for (auto category : kAllTradeCategories) {
        std::cout << "  - " << toString(category) << std::endl;
    }

    // Ставки показываем, только если конфигурация доступна
    auto scheduleResult = ensureSchedule(cmd);
    if (!scheduleResult) {
        std::cerr << "Note: tax rates not shown: " << scheduleResult.error() << std::endl;
        return {};
    }

    for (const auto& [period, rules] : schedule_->periods()) {
        std::cout << "\nRules effective from " << formatYearMonth(period) << ":" << std::endl;
        for (const auto& [lane, rate] : rules.rates()) {
            std::cout << "  " << std::left << std::setw(24) << describeLane(lane) << std::right
                      << std::fixed << std::setprecision(2) << rate * 100.0 << "%" << std::endl;
        }
        if (auto threshold = rules.stockSwingExemptionThreshold()) {
            std::cout << "  Stock swing-trade exemption up to "
                      << std::fixed << std::setprecision(2) << *threshold << std::endl;
        }
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════════

std::expected<bool, std::string> CommandExecutor::wantsJson(const ParsedCommand& cmd) const
{
    if (!cmd.options.count("format")) {
        return false;
    }

    const auto format = cmd.options.at("format").as<std::string>();
    if (format == "json") {
        return true;
    }
    if (format == "text") {
        return false;
    }
    return std::unexpected("Unknown format: " + format + " (expected text or json)");
}

std::expected<Operation, std::string> CommandExecutor::buildOperation(
    const ParsedCommand& cmd) const
{
    auto codeResult = getRequiredOption<std::string>(cmd, "asset-code");
    if (!codeResult) {
        return std::unexpected(codeResult.error());
    }

    auto typeText = getRequiredOption<std::string>(cmd, "asset-type");
    if (!typeText) {
        return std::unexpected(typeText.error());
    }

    auto operationText = getRequiredOption<std::string>(cmd, "type");
    if (!operationText) {
        return std::unexpected(operationText.error());
    }

    auto quantity = getRequiredOption<double>(cmd, "quantity");
    if (!quantity) {
        return std::unexpected(quantity.error());
    }

    auto price = getRequiredOption<double>(cmd, "price");
    if (!price) {
        return std::unexpected(price.error());
    }

    auto dateText = getRequiredOption<std::string>(cmd, "date");
    if (!dateText) {
        return std::unexpected(dateText.error());
    }

    Operation operation;
    operation.assetCode = *codeResult;
    operation.quantity = *quantity;
    operation.unitPrice = *price;

    auto assetType = parseAssetType(*typeText);
    if (!assetType) {
        return std::unexpected(assetType.error());
    }
    operation.assetType = *assetType;

    std::string categoryText = "swing_trade";
    if (cmd.options.count("category")) {
        categoryText = cmd.options.at("category").as<std::string>();
    }
    auto category = parseTradeCategory(categoryText);
    if (!category) {
        return std::unexpected(category.error());
    }
    operation.tradeCategory = *category;

    auto operationType = parseOperationType(*operationText);
    if (!operationType) {
        return std::unexpected(operationType.error());
    }
    operation.operationType = *operationType;

    auto date = parseDate(*dateText);
    if (!date) {
        return std::unexpected(date.error());
    }
    operation.operationDate = *date;

    operation.totalCost = cmd.options.count("total-cost")
        ? cmd.options.at("total-cost").as<double>()
        : operation.quantity * operation.unitPrice;

    if (cmd.options.count("ir-retained")) {
        operation.irRetained = cmd.options.at("ir-retained").as<double>();
    }

    return operation;
}

std::expected<std::size_t, std::string> CommandExecutor::storeOperations(
    const ParsedCommand& cmd,
    const std::vector<Operation>& operations)
{
    auto storeResult = ensureStore(cmd);
    if (!storeResult) {
        return std::unexpected(storeResult.error());
    }

    std::set<std::string> added;
    for (const auto& operation : operations) {
        auto id = store_->add(operation);
        if (!id) {
            std::cerr << "Warning: " << id.error() << std::endl;
            continue;
        }
        added.insert(*id);
    }

    // Продажа сверх позиции не должна попасть в историю: новая операция,
    // на которой падает пересчет, откатывается, и проверка повторяется
    while (!added.empty()) {
        auto checked = checkHistory();
        if (checked) {
            break;
        }

        const auto& error = checked.error();
        if (error.code == ErrorCode::InsufficientPosition && added.count(error.operationId)) {
            auto removed = store_->remove(error.operationId);
            if (!removed) {
                return std::unexpected(removed.error());
            }
            added.erase(error.operationId);

            if (operations.size() == 1) {
                return std::unexpected(error.describe());
            }
            std::cerr << "Warning: " << error.describe() << std::endl;
            continue;
        }

        // Ошибка на ранее сохраненной операции (например, задним числом
        // продана часть позиции под более позднюю продажу): откатываем все новые
        for (const auto& id : added) {
            auto removed = store_->remove(id);
            if (!removed) {
                return std::unexpected(removed.error());
            }
        }
        return std::unexpected(error.describe());
    }

    return added.size();
}

Result CommandExecutor::checkHistory()
{
    auto history = store_->list();
    if (!history) {
        return makeError(ErrorCode::StorageError, history.error());
    }

    PositionTracker tracker;
    auto recomputed = tracker.recompute(*history);
    if (!recomputed) {
        return std::unexpected(recomputed.error());
    }
    return {};
}

void CommandExecutor::printWarnings(const ValidationReport& report) const
{
    for (const auto& error : report.rejected) {
        std::cerr << "Warning: skipped operation: " << error.describe() << std::endl;
    }
}

void CommandExecutor::printOperations(const std::vector<Operation>& operations) const
{
    std::cout << std::left
              << std::setw(38) << "ID"
              << std::setw(12) << "DATE"
              << std::setw(10) << "ASSET"
              << std::setw(8) << "TYPE"
              << std::setw(13) << "CATEGORY"
              << std::setw(8) << "OP"
              << std::right
              << std::setw(12) << "QUANTITY"
              << std::setw(12) << "PRICE"
              << std::setw(14) << "TOTAL" << std::endl;
    std::cout << std::string(127, '-') << std::endl;

    for (const auto& operation : operations) {
        std::cout << std::left
                  << std::setw(38) << operation.id
                  << std::setw(12) << formatDate(operation.operationDate)
                  << std::setw(10) << operation.assetCode
                  << std::setw(8) << toString(operation.assetType)
                  << std::setw(13) << toString(operation.tradeCategory)
                  << std::setw(8) << toString(operation.operationType)
                  << std::right << std::fixed
                  << std::setw(12) << std::setprecision(4) << operation.quantity
                  << std::setw(12) << std::setprecision(2) << operation.unitPrice
                  << std::setw(14) << operation.totalCost << std::endl;
    }
}

void CommandExecutor::printReport(const DarfReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DARF " << formatYearMonth(report.period) << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (report.empty()) {
        std::cout << "No taxable sales in this month." << std::endl;
    }

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& item : report.items) {
        std::cout << describeLane(item.key.lane()) << std::endl;
        std::cout << "  Sales:          " << item.totalSales << std::endl;
        std::cout << "  Net result:     " << item.netResult << std::endl;
        if (item.lossCarryConsumed > 0.0) {
            std::cout << "  Losses offset:  " << item.lossCarryConsumed << std::endl;
        }
        if (item.exemptionApplied) {
            std::cout << "  Exempt (sales within monthly threshold)" << std::endl;
        }
        std::cout << "  Taxable profit: " << item.taxableProfit << std::endl;
        std::cout << "  Rate:           " << item.taxRate * 100.0 << "%" << std::endl;
        std::cout << "  Tax due:        " << item.taxDue << std::endl;
        std::cout << "  IR retained:    " << item.irRetained << std::endl;
        std::cout << "  Net tax due:    " << item.netTaxDue << std::endl;
        std::cout << "  Loss carry:     " << item.lossCarryRemaining << std::endl;
    }

    std::cout << std::string(70, '-') << std::endl;
    std::cout << "TOTAL DUE: " << report.totalDue << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

}  // namespace darf
