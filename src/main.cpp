#include <iostream>
#include "presentation/cli.h"
#include "presentation/container.h"
#include "presentation/result_renderer.h"
#include "infrastructure/error_handler.h"

using namespace ulagen;

int main(int argc, char* argv[]) {
    try {
        auto options = presentation::CommandLineParser::parse(argc, argv);

        if (options.show_help) {
            presentation::CommandLineParser::print_usage(std::cout);
            return presentation::EXIT_OK;
        }
        if (options.show_version) {
            presentation::CommandLineParser::print_version(std::cout);
            return presentation::EXIT_OK;
        }

        auto& container = presentation::DependencyContainer::instance();
        container.initialize(options, std::cin, std::cerr);

        auto renderer = container.get_result_renderer();
        auto result = container.get_generate_use_case()->execute();

        renderer.render(result, std::cout);
        return presentation::EXIT_OK;

    } catch (const infrastructure::ConfigurationException& e) {
        presentation::ResultRenderer::render_error(e, std::cerr);
        std::cerr << "use --help for usage information\n";
        return presentation::exit_code_for(e);
    } catch (const std::exception& e) {
        presentation::ResultRenderer::render_error(e, std::cerr);
        return presentation::exit_code_for(e);
    }
}
