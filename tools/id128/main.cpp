#include "id128_tool.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    auto config = sdid128::tool::parse_options(argc, argv);
    if (config.is_error()) {
        std::cerr << "id128: " << config.error_message() << "\n";
        sdid128::tool::print_usage(std::cerr, argv[0]);
        return 1;
    }

    return sdid128::tool::run(config.value(), std::cout, std::cerr);
}
