#pragma once

#include "IOperationStore.hpp"
#include <sqlite3.h>
#include <string>
#include <memory>
#include <filesystem>

namespace darf {

class SQLiteOperationStore : public IOperationStore {
    // Доступ к конструктору без открытия базы только для open()
    struct Unopened {};

public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // Бросает std::runtime_error, если базу не удалось открыть
    explicit SQLiteOperationStore(std::string_view dbPath);
    ~SQLiteOperationStore() override;

    explicit SQLiteOperationStore(Unopened) {}

    // Вариант без исключений
    static std::expected<std::unique_ptr<SQLiteOperationStore>, std::string> open(
        std::string_view dbPath);

    // ═════════════════════════════════════════════════════════════════════════
    // IOperationStore interface
    // ═════════════════════════════════════════════════════════════════════════

    std::expected<std::string, std::string> add(const Operation& operation) override;

    std::expected<std::vector<Operation>, std::string> list(
        const OperationFilter& filter = {}) override;

    std::expected<Operation, std::string> get(std::string_view id) override;

    std::expected<void, std::string> remove(std::string_view id) override;

    std::expected<std::size_t, std::string> count() override;

    const std::string& path() const noexcept { return dbPath_; }

private:
    sqlite3* db_ = nullptr;
    std::string dbPath_;

    // ═════════════════════════════════════════════════════════════════════════
    // Вспомогательные методы
    // ═════════════════════════════════════════════════════════════════════════

    std::expected<void, std::string> initializeDatabase(std::string_view path);
    std::expected<void, std::string> createTables();

    std::expected<Operation, std::string> readRow(sqlite3_stmt* stmt) const;

    static std::string currentTimestamp();
};

}  // namespace darf
