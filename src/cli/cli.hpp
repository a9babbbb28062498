#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include <tincture/config.hpp>

namespace tincture::cli
{

// Runs one invocation of the command-line tool. `argv[0]` is the program
// name. Documents and listings go to `out`, usage text to `err`; diagnostics
// go through Logger. `load_config` is called once global options have been
// read, so `--help` works with a broken config file.
//
// Returns 0 on success, 1 when an operation fails with an Error, 2 on a usage
// error.
int run(const std::vector<std::string>& argv,
        const std::function<Config()>&  load_config,
        std::ostream&                   out,
        std::ostream&                   err);

}   // namespace tincture::cli
