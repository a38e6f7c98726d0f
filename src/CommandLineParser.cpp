#include "CommandLineParser.hpp"
#include <sstream>

namespace darf {

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'darf help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help: "darf help darf", "darf operation --help"
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        if (argv[j][0] != '-') {
                            result.positional.push_back(argv[j]);
                        }
                    }
                } else {
                    result.positional.push_back(result.command);
                    result.command = "help";
                }
                return result;
            }
        }

        // Определяем есть ли subcommand
        int startIdx = 2;
        bool hasSubcommands = (result.command == "operation" ||
                               result.command == "portfolio" ||
                               result.command == "assets");

        if (hasSubcommands && argc > 2 && argv[2][0] != '-') {
            result.subcommand = argv[2];
            startIdx = 3;
        }

        std::vector<std::string> args(argv + startIdx, argv + argc);

        // Парсим опции
        if (result.command == "operation") {
            auto desc = createOperationOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "darf") {
            auto desc = createDarfOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "portfolio") {
            auto desc = createPortfolioOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "assets") {
            auto desc = createAssetsOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "version") {
            for (int i = startIdx; i < argc; ++i) {
                result.positional.push_back(argv[i]);
            }
        } else {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return std::unexpected(oss.str());
        }

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Common Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createCommonOptions() {
    po::options_description desc("Common options");
    desc.add_options()
        ("db-path", po::value<std::string>(),
         "SQLite database file (default: $DARF_DB_PATH or ~/.darf/operations.db)")

        ("config", po::value<std::string>(),
         "Tax rules file (default: $DARF_CONFIG or ./config/tax_rules.conf)");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Operation Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createOperationOptions() {
    po::options_description desc("Operation options");
    desc.add_options()
        ("id", po::value<std::string>(),
         "Operation ID")

        ("asset-code,a", po::value<std::string>(),
         "Asset code (e.g., PETR4)")

        ("asset-type", po::value<std::string>(),
         "Asset type: acao, etf, fii, bdr, opcao, cripto")

        ("category,c", po::value<std::string>()->default_value("swing_trade"),
         "Trade category: swing_trade, day_trade")

        ("type,t", po::value<std::string>(),
         "Operation type: compra, venda")

        ("quantity,q", po::value<double>(),
         "Quantity")

        ("price,p", po::value<double>(),
         "Unit price")

        ("total-cost", po::value<double>(),
         "Total cost with fees (default: quantity * price)")

        ("date,d", po::value<std::string>(),
         "Operation date (YYYY-MM-DD)")

        ("ir-retained", po::value<double>(),
         "Tax withheld at source by the broker")

        ("file,f", po::value<std::string>(),
         "CSV or JSON file to import")

        ("delimiter", po::value<char>()->default_value(','),
         "CSV delimiter")

        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json");

    desc.add(createCommonOptions());
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// DARF Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createDarfOptions() {
    po::options_description desc("DARF options");
    desc.add_options()
        ("year,y", po::value<int>()->required(),
         "Year")

        ("month,m", po::value<int>(),
         "Month (1-12); whole year if omitted")

        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json");

    desc.add(createCommonOptions());
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Portfolio Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createPortfolioOptions() {
    po::options_description desc("Portfolio options");
    desc.add_options()
        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json");

    desc.add(createCommonOptions());
    return desc;
}

po::options_description CommandLineParser::createAssetsOptions() {
    po::options_description desc("Assets options");
    desc.add_options()
        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json");

    desc.add(createCommonOptions());
    return desc;
}

}  // namespace darf
