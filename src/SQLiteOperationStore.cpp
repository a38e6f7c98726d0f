#include "SQLiteOperationStore.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace darf {

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteOperationStore::SQLiteOperationStore(std::string_view dbPath)
{
    auto result = initializeDatabase(dbPath);
    if (!result) {
        throw std::runtime_error("Failed to initialize database: " + result.error());
    }
}

SQLiteOperationStore::~SQLiteOperationStore()
{
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::expected<std::unique_ptr<SQLiteOperationStore>, std::string>
SQLiteOperationStore::open(std::string_view dbPath)
{
    auto store = std::make_unique<SQLiteOperationStore>(Unopened{});

    auto result = store->initializeDatabase(dbPath);
    if (!result) {
        return std::unexpected("Failed to initialize database: " + result.error());
    }

    return store;
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> SQLiteOperationStore::initializeDatabase(
    std::string_view path)
{
    if (path.empty()) {
        return std::unexpected("Database path cannot be empty");
    }

    dbPath_ = std::string(path);

    // Каталог базы создаем при необходимости (кроме :memory:)
    std::filesystem::path fsPath(dbPath_);
    if (dbPath_ != ":memory:" && fsPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(fsPath.parent_path(), ec);
        if (ec) {
            return std::unexpected("Failed to create directory " +
                                   fsPath.parent_path().string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    return {};
}

std::expected<void, std::string> SQLiteOperationStore::createTables()
{
    const char* sql = R"(
        -- Операции в порядке добавления: seq разрешает равные даты
        CREATE TABLE IF NOT EXISTS operations (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            asset_code TEXT NOT NULL,
            asset_type TEXT NOT NULL,
            trade_category TEXT NOT NULL,
            operation_type TEXT NOT NULL,
            quantity REAL NOT NULL,
            unit_price REAL NOT NULL,
            total_cost REAL NOT NULL,
            operation_date TEXT NOT NULL,
            ir_retained REAL,
            created_at TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_operations_asset_code ON operations(asset_code);
        CREATE INDEX IF NOT EXISTS idx_operations_asset_type ON operations(asset_type);
        CREATE INDEX IF NOT EXISTS idx_operations_date ON operations(operation_date);
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to create tables: " + error);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Запись
// ═════════════════════════════════════════════════════════════════════════════

std::expected<std::string, std::string> SQLiteOperationStore::add(const Operation& operation)
{
    if (!db_) {
        return std::unexpected("Database not initialized");
    }

    Operation stored = operation;
    stored.assetCode = normalizeAssetCode(operation.assetCode);
    if (stored.id.empty()) {
        stored.id = generateOperationId();
    }

    const char* sql = R"(
        INSERT INTO operations (
            id, asset_code, asset_type, trade_category, operation_type,
            quantity, unit_price, total_cost, operation_date, ir_retained, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
    }

    const std::string assetType(toString(stored.assetType));
    const std::string tradeCategory(toString(stored.tradeCategory));
    const std::string operationType(toString(stored.operationType));
    const std::string date = formatDate(stored.operationDate);
    const std::string createdAt = currentTimestamp();

    sqlite3_bind_text(stmt, 1, stored.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, stored.assetCode.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, assetType.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, tradeCategory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, operationType.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 6, stored.quantity);
    sqlite3_bind_double(stmt, 7, stored.unitPrice);
    sqlite3_bind_double(stmt, 8, stored.totalCost);
    sqlite3_bind_text(stmt, 9, date.c_str(), -1, SQLITE_TRANSIENT);
    if (stored.irRetained) {
        sqlite3_bind_double(stmt, 10, *stored.irRetained);
    } else {
        sqlite3_bind_null(stmt, 10);
    }
    sqlite3_bind_text(stmt, 11, createdAt.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return std::unexpected("Operation already exists: " + stored.id);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to insert operation: " + std::string(sqlite3_errmsg(db_)));
    }

    return stored.id;
}

std::expected<void, std::string> SQLiteOperationStore::remove(std::string_view id)
{
    if (!db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = "DELETE FROM operations WHERE id = ?";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare delete: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, id.data(), static_cast<int>(id.size()), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete operation: " + std::string(sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return std::unexpected("Operation not found: " + std::string(id));
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение
// ═════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<Operation>, std::string> SQLiteOperationStore::list(
    const OperationFilter& filter)
{
    if (!db_) {
        return std::unexpected("Database not initialized");
    }

    std::string sql =
        "SELECT id, asset_code, asset_type, trade_category, operation_type, "
        "quantity, unit_price, total_cost, operation_date, ir_retained "
        "FROM operations WHERE 1=1";

    const std::string assetCode = normalizeAssetCode(filter.assetCode);
    const std::string assetType = filter.assetType
        ? std::string(toString(*filter.assetType))
        : std::string();

    if (!assetCode.empty()) {
        sql += " AND asset_code = ?";
    }
    if (!assetType.empty()) {
        sql += " AND asset_type = ?";
    }
    sql += " ORDER BY seq";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare select: " + std::string(sqlite3_errmsg(db_)));
    }

    int paramIndex = 1;
    if (!assetCode.empty()) {
        sqlite3_bind_text(stmt, paramIndex++, assetCode.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (!assetType.empty()) {
        sqlite3_bind_text(stmt, paramIndex++, assetType.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<Operation> operations;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto operation = readRow(stmt);
        if (!operation) {
            sqlite3_finalize(stmt);
            return std::unexpected(operation.error());
        }
        operations.push_back(std::move(*operation));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to read operations: " + std::string(sqlite3_errmsg(db_)));
    }

    return operations;
}

std::expected<Operation, std::string> SQLiteOperationStore::get(std::string_view id)
{
    if (!db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql =
        "SELECT id, asset_code, asset_type, trade_category, operation_type, "
        "quantity, unit_price, total_cost, operation_date, ir_retained "
        "FROM operations WHERE id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare select: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, id.data(), static_cast<int>(id.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::unexpected("Operation not found: " + std::string(id));
    }

    auto operation = readRow(stmt);
    sqlite3_finalize(stmt);
    return operation;
}

std::expected<std::size_t, std::string> SQLiteOperationStore::count()
{
    if (!db_) {
        return std::unexpected("Database not initialized");
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM operations", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare count: " + std::string(sqlite3_errmsg(db_)));
    }

    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    return total;
}

// ═════════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════════

std::expected<Operation, std::string> SQLiteOperationStore::readRow(sqlite3_stmt* stmt) const
{
    auto columnText = [stmt](int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    };

    Operation operation;
    operation.id = columnText(0);
    operation.assetCode = columnText(1);

    auto assetType = parseAssetType(columnText(2));
    if (!assetType) {
        return std::unexpected("Corrupted row " + operation.id + ": " + assetType.error());
    }
    operation.assetType = *assetType;

    auto category = parseTradeCategory(columnText(3));
    if (!category) {
        return std::unexpected("Corrupted row " + operation.id + ": " + category.error());
    }
    operation.tradeCategory = *category;

    auto operationType = parseOperationType(columnText(4));
    if (!operationType) {
        return std::unexpected("Corrupted row " + operation.id + ": " + operationType.error());
    }
    operation.operationType = *operationType;

    operation.quantity = sqlite3_column_double(stmt, 5);
    operation.unitPrice = sqlite3_column_double(stmt, 6);
    operation.totalCost = sqlite3_column_double(stmt, 7);

    auto date = parseDate(columnText(8));
    if (!date) {
        return std::unexpected("Corrupted row " + operation.id + ": " + date.error());
    }
    operation.operationDate = *date;

    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        operation.irRetained = sqlite3_column_double(stmt, 9);
    }

    return operation;
}

std::string SQLiteOperationStore::currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = {};
    gmtime_r(&time, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

}  // namespace darf
