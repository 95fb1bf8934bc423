#include "Modelgate/CliParser.hpp"
#include "Modelgate/Core.hpp"
#include "Modelgate/GatewayConfig.hpp"
#include "Modelgate/Store.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Modelgate::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core loads the configuration and the store, then dispatches the
    // parsed command.
    try {
        Modelgate::Core core(parser.getCommands());
        return core.run();
    } catch (const Modelgate::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const Modelgate::StoreError& e) {
        std::cerr << "Storage error: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
