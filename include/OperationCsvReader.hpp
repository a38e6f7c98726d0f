#pragma once

#include "Operation.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Импорт операций из CSV
// ═══════════════════════════════════════════════════════════════════════════════

// Абстрактный интерфейс для чтения файлов
class IFileReader {
public:
    virtual ~IFileReader() = default;

    // Все строки файла, включая пустые (нумерация строк сохраняется)
    virtual std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) = 0;
};

// Реальная реализация для чтения файлов
class FileReader : public IFileReader {
public:
    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override;
};

struct CsvLineError {
    std::size_t lineNumber = 0;   // с единицы, как в редакторе
    std::string message;
};

struct CsvImportResult {
    std::vector<Operation> operations;
    std::vector<CsvLineError> errors;
};

// Столбцы: date,asset_code,asset_type,trade_category,operation_type,
//          quantity,unit_price,total_cost[,ir_retained]
// С заголовком столбцы ищутся по имени, без заголовка - по порядку.
// Пустой total_cost = quantity * unit_price.
class OperationCsvReader {
public:
    explicit OperationCsvReader(
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',',
        bool hasHeader = true);

    // Ошибка только если файл не прочитан или заголовок неполный.
    // Нераспознанные строки попадают в errors, остальные в operations.
    std::expected<CsvImportResult, std::string> read(std::string_view filePath) const;

    std::expected<CsvImportResult, std::string> parse(
        const std::vector<std::string>& lines) const;

private:
    std::shared_ptr<IFileReader> reader_;
    char delimiter_;
    bool hasHeader_;

    using ColumnMap = std::map<std::string, std::size_t>;

    std::expected<ColumnMap, std::string> parseHeader(std::string_view line) const;

    std::expected<Operation, std::string> parseRow(
        const std::vector<std::string>& fields,
        const ColumnMap& columns) const;

    std::vector<std::string> parseCSVLine(std::string_view line) const;

    static std::expected<double, std::string> parseNumber(
        std::string_view field,
        std::string_view column);
};

}  // namespace darf
