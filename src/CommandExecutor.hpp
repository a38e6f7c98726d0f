#pragma once

#include "CommandLineParser.hpp"
#include "IOperationStore.hpp"
#include "TaxRules.hpp"
#include "DarfEngine.hpp"
#include <memory>
#include <expected>
#include <iostream>
#include <filesystem>

namespace darf {

class CommandExecutor {
public:
    // store и schedule можно передать заранее (тесты); иначе они
    // открываются по --db-path / --config при первом использовании
    explicit CommandExecutor(
        std::shared_ptr<IOperationStore> store = nullptr,
        std::shared_ptr<const TaxRuleSchedule> schedule = nullptr);

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

    // Пути по умолчанию: переменная окружения, затем встроенное значение
    static std::filesystem::path defaultDatabasePath();
    static std::filesystem::path defaultConfigPath();

private:
    std::shared_ptr<IOperationStore> store_;
    std::shared_ptr<const TaxRuleSchedule> schedule_;
    std::unique_ptr<DarfEngine> engine_;

    std::expected<void, std::string> ensureStore(const ParsedCommand& cmd);
    std::expected<void, std::string> ensureSchedule(const ParsedCommand& cmd);

    // Пересчет по всей истории хранилища с выводом предупреждений
    std::expected<std::shared_ptr<const PublishedResult>, std::string> runEngine(
        const ParsedCommand& cmd);

    // Help & Version
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    std::expected<void, std::string> executeVersion(const ParsedCommand& cmd);
    void printHelp(std::string_view topic = "");
    void printVersion() const;

    // Operation Management
    std::expected<void, std::string> executeOperation(const ParsedCommand& cmd);
    std::expected<void, std::string> executeOperationAdd(const ParsedCommand& cmd);
    std::expected<void, std::string> executeOperationList(const ParsedCommand& cmd);
    std::expected<void, std::string> executeOperationDelete(const ParsedCommand& cmd);
    std::expected<void, std::string> executeOperationImport(const ParsedCommand& cmd);

    // DARF
    std::expected<void, std::string> executeDarf(const ParsedCommand& cmd);

    // Portfolio
    std::expected<void, std::string> executePortfolio(const ParsedCommand& cmd);
    std::expected<void, std::string> executePortfolioSummary(const ParsedCommand& cmd);

    // Assets
    std::expected<void, std::string> executeAssets(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAssetsTypes(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    std::expected<bool, std::string> wantsJson(const ParsedCommand& cmd) const;

    std::expected<Operation, std::string> buildOperation(const ParsedCommand& cmd) const;

    // Сохраняет операции и отбрасывает те, что ломают историю
    // (продажа сверх позиции); возвращает число сохраненных.
    // Если история ломается на старой операции, откатываются все новые
    std::expected<std::size_t, std::string> storeOperations(
        const ParsedCommand& cmd,
        const std::vector<Operation>& operations);

    // Пересчет позиций по всей истории хранилища
    Result checkHistory();

    void printWarnings(const ValidationReport& report) const;
    void printOperations(const std::vector<Operation>& operations) const;
    void printReport(const DarfReport& report) const;
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace darf
