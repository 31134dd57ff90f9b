#pragma once

#include <acb/options.hpp>
#include <acb/result.hpp>
#include <string>

namespace acb {

// Runs the external bundler in the console's working directory. The bundler
// writes its output to <working_dir>/dist.
class Bundler {
public:
    Bundler(std::string working_dir, BundlerConfig config);

    std::string output_dir() const;

    // Removes the output directory, then runs the bundler command
    Status bundle() const;

    Status clean_output() const;
    Status run() const;

private:
    std::string working_dir_;
    BundlerConfig config_;
};

} // namespace acb
