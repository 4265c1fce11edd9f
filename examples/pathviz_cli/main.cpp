#include "CliOptions.h"
#include "CliRunner.h"

#include <pathviz/catalog/GraphCatalog.h>
#include <pathviz/common/Logger.h>

#include <iostream>

using namespace pathviz;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "pathviz";

    cli::CliOptions options;
    try {
        options = cli::parseCliOptions(argc, argv);
    } catch (const cli::UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << cli::usageText(program);
        return cli::EXIT_USAGE;
    }

    if (options.help) {
        std::cout << cli::usageText(program);
        return cli::EXIT_OK;
    }

    if (int code = cli::setupLogging(options, std::cerr); code != cli::EXIT_OK) {
        return code;
    }

    auto catalog = GraphCatalog::withBuiltinGraphs();
    int code = cli::runCli(options, catalog, std::cout, std::cerr);

    Logger::flush();
    return code;
}
