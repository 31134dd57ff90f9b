#include <acb/bundler.hpp>
#include <acb/log.hpp>
#include <acb/process.hpp>

#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace acb {

// Last few non-empty lines of a stream, for error hints
static std::string tail_lines(const std::string& text, size_t max_lines) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }

    size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string out;
    for (size_t i = first; i < lines.size(); ++i) {
        if (!out.empty()) out += '\n';
        out += lines[i];
    }
    return out;
}

Bundler::Bundler(std::string working_dir, BundlerConfig config)
    : working_dir_(std::move(working_dir)), config_(std::move(config)) {}

std::string Bundler::output_dir() const {
    return (fs::path(working_dir_) / "dist").string();
}

Status Bundler::bundle() const {
    ACB_TRY(clean_output());
    return run();
}

Status Bundler::clean_output() const {
    log::debug("cleaning build output directory...");
    std::error_code ec;
    fs::remove_all(output_dir(), ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot clean bundler output: " + ec.message(), "", output_dir()};
    }
    return ok_status();
}

Status Bundler::run() const {
    log::info("bundling API console...");

    auto r = run_command(config_.command, working_dir_, config_.timeout_seconds);
    ACB_TRY(r);
    const CommandResult& res = r.value();

    if (!res.stdout_str.empty()) {
        log::debug("%s", res.stdout_str.c_str());
    }
    if (!res.stderr_str.empty()) {
        log::error("%s", res.stderr_str.c_str());
    }

    if (res.exit_code != 0) {
        std::string hint = tail_lines(res.stderr_str, 5);
        if (hint.empty() && res.exit_code == 127) {
            hint = "is `" + config_.command.front() + "` installed in " + working_dir_ + "?";
        }
        return AcbError{AcbError::Process,
            "bundler `" + command_line(config_.command) + "` exited with code "
                + std::to_string(res.exit_code),
            hint};
    }

    log::info("bundler finished");
    return ok_status();
}

} // namespace acb
