// tincture: generate color themes and export them to application configs.

#include "cli/cli.hpp"

#include <tincture/config.hpp>
#include <tincture/logger.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    tincture::Logger::instance().add_sink(tincture::sinks::stderr_sink());
    return tincture::cli::run(std::vector<std::string>(argv, argv + argc),
                              &tincture::Config::load_default,
                              std::cout,
                              std::cerr);
}
