#include "OperationCsvReader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <exception>

namespace darf {

namespace {

const std::vector<std::string> kRequiredColumns = {
    "date", "asset_code", "asset_type", "trade_category",
    "operation_type", "quantity", "unit_price"
};

// Порядок столбцов файла без заголовка
const std::vector<std::string> kDefaultColumns = {
    "date", "asset_code", "asset_type", "trade_category",
    "operation_type", "quantity", "unit_price", "total_cost", "ir_retained"
};

bool isBlank(std::string_view line)
{
    return std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> FileReader::readLines(
    std::string_view filePath)
{
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════════
// OperationCsvReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

OperationCsvReader::OperationCsvReader(
    std::shared_ptr<IFileReader> reader,
    char delimiter,
    bool hasHeader)
    : reader_(reader ? reader : std::make_shared<FileReader>()),
      delimiter_(delimiter),
      hasHeader_(hasHeader) {}

std::expected<CsvImportResult, std::string> OperationCsvReader::read(
    std::string_view filePath) const
{
    auto linesResult = reader_->readLines(filePath);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    return parse(*linesResult);
}

std::expected<CsvImportResult, std::string> OperationCsvReader::parse(
    const std::vector<std::string>& lines) const
{
    std::size_t firstRow = 0;
    ColumnMap columns;

    if (hasHeader_) {
        // Заголовок - первая непустая строка
        while (firstRow < lines.size() && isBlank(lines[firstRow])) {
            ++firstRow;
        }
        if (firstRow == lines.size()) {
            return std::unexpected("File has no header line");
        }

        auto header = parseHeader(lines[firstRow]);
        if (!header) {
            return std::unexpected(header.error());
        }
        columns = std::move(*header);
        ++firstRow;
    } else {
        for (std::size_t i = 0; i < kDefaultColumns.size(); ++i) {
            columns[kDefaultColumns[i]] = i;
        }
    }

    CsvImportResult result;

    for (std::size_t i = firstRow; i < lines.size(); ++i) {
        if (isBlank(lines[i])) {
            continue;
        }

        auto operation = parseRow(parseCSVLine(lines[i]), columns);
        if (!operation) {
            result.errors.push_back(CsvLineError{i + 1, operation.error()});
            continue;
        }

        result.operations.push_back(std::move(*operation));
    }

    return result;
}

std::expected<OperationCsvReader::ColumnMap, std::string> OperationCsvReader::parseHeader(
    std::string_view line) const
{
    ColumnMap columns;
    auto fields = parseCSVLine(line);

    for (std::size_t i = 0; i < fields.size(); ++i) {
        std::string name = fields[i];
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        columns[name] = i;
    }

    for (const auto& required : kRequiredColumns) {
        if (!columns.count(required)) {
            return std::unexpected("Missing required column: " + required);
        }
    }

    return columns;
}

std::expected<Operation, std::string> OperationCsvReader::parseRow(
    const std::vector<std::string>& fields,
    const ColumnMap& columns) const
{
    auto field = [&](const std::string& column) -> std::string {
        auto it = columns.find(column);
        if (it == columns.end() || it->second >= fields.size()) {
            return "";
        }
        return fields[it->second];
    };

    for (const auto& required : kRequiredColumns) {
        if (field(required).empty()) {
            return std::unexpected("Missing value for column '" + required + "'");
        }
    }

    Operation operation;
    operation.assetCode = field("asset_code");

    auto date = parseDate(field("date"));
    if (!date) {
        return std::unexpected(date.error());
    }
    operation.operationDate = *date;

    auto assetType = parseAssetType(field("asset_type"));
    if (!assetType) {
        return std::unexpected(assetType.error());
    }
    operation.assetType = *assetType;

    auto category = parseTradeCategory(field("trade_category"));
    if (!category) {
        return std::unexpected(category.error());
    }
    operation.tradeCategory = *category;

    auto operationType = parseOperationType(field("operation_type"));
    if (!operationType) {
        return std::unexpected(operationType.error());
    }
    operation.operationType = *operationType;

    auto quantity = parseNumber(field("quantity"), "quantity");
    if (!quantity) {
        return std::unexpected(quantity.error());
    }
    operation.quantity = *quantity;

    auto unitPrice = parseNumber(field("unit_price"), "unit_price");
    if (!unitPrice) {
        return std::unexpected(unitPrice.error());
    }
    operation.unitPrice = *unitPrice;

    const std::string totalCost = field("total_cost");
    if (totalCost.empty()) {
        operation.totalCost = operation.quantity * operation.unitPrice;
    } else {
        auto value = parseNumber(totalCost, "total_cost");
        if (!value) {
            return std::unexpected(value.error());
        }
        operation.totalCost = *value;
    }

    const std::string irRetained = field("ir_retained");
    if (!irRetained.empty()) {
        auto value = parseNumber(irRetained, "ir_retained");
        if (!value) {
            return std::unexpected(value.error());
        }
        operation.irRetained = *value;
    }

    return operation;
}

std::vector<std::string> OperationCsvReader::parseCSVLine(std::string_view line) const
{
    std::vector<std::string> fields;
    std::istringstream iss{std::string(line)};
    std::string field;

    while (std::getline(iss, field, delimiter_)) {
        // Убираем пробелы с концов
        auto start = field.find_first_not_of(" \t\r\n");
        auto end = field.find_last_not_of(" \t\r\n");

        if (start == std::string::npos) {
            fields.push_back("");  // пустое поле
        } else {
            fields.push_back(field.substr(start, end - start + 1));
        }
    }

    return fields;
}

std::expected<double, std::string> OperationCsvReader::parseNumber(
    std::string_view field,
    std::string_view column)
{
    try {
        std::size_t idx;
        double value = std::stod(std::string(field), &idx);
        if (idx == field.length()) {
            return value;
        }
    } catch (const std::exception&) {
    }

    return std::unexpected("Invalid number in column '" + std::string(column) +
                           "': " + std::string(field));
}

}  // namespace darf
