#include <grg/cli.hpp>
#include <grg/log.hpp>

#include <iostream>

int main(int argc, char** argv) {
    auto opts = grg::parse_args(argc, argv);
    if (opts.is_err()) {
        grg::log::error("%s", opts.error().format().c_str());
        std::cerr << grg::usage_text();
        return grg::ExitUsage;
    }

    grg::SystemProcessRunner runner;
    return grg::run_cli(opts.value(), std::cout, runner);
}
