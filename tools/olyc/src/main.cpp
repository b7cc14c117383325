// tools/olyc/src/main.cpp
#include <olyc/cli/Options.hpp>
#include <olyc/driver/Driver.hpp>
#include <olympiac/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << olympiac::k_version_string << "\n";
        olyc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = olyc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        olyc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == olyc::cli::Mode::kVersion) {
        std::cout << olympiac::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == olyc::cli::Mode::kUsage) {
        olyc::cli::print_usage(std::cout);
        return 0;
    }

    return olyc::driver::run(opt);
}
