#include <labelbridge/cli/ConvertCommand.hpp>

#include <iostream>

int main(int argc, char** argv) {
    auto options = LB::CLI::parse_convert_options(argc, argv);
    if (!options) {
        LB::CLI::print_usage(std::cerr);
        return 1;
    }
    return LB::CLI::run_convert(*options);
}
