#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>
#include <expected>

namespace po = boost::program_options;

namespace darf {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    po::options_description createOperationOptions();
    po::options_description createDarfOptions();
    po::options_description createPortfolioOptions();
    po::options_description createAssetsOptions();

private:
    // --db-path, --config
    po::options_description createCommonOptions();
};

}  // namespace darf
