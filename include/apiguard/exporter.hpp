#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace apiguard {

    struct export_request {
        std::string target{};
        std::vector<std::string> command{};
        std::filesystem::path symbol_graph_dir{};
        std::filesystem::path output_dir{};
        std::chrono::milliseconds timeout{600'000};
    };

    struct process_result {
        int exit_code{-1};
        bool timed_out{false};
    };

    // Runs args[0] (PATH lookup) with stdout/stderr redirected to the given files. On timeout the child's
    // process group is killed and reaped before returning.
    process_result run_process(
            const std::vector<std::string>& args,
            const std::filesystem::path& stdout_path,
            const std::filesystem::path& stderr_path,
            std::chrono::milliseconds timeout);

    // Runs the export command, then copies the newest <target>.symbols.json or <target>@*.symbols.json from
    // symbol_graph_dir to <output_dir>/<target>/<target>.symbols.json and returns that path.
    // Throws guard_error{export_unavailable} on failure, timeout, or when no export was produced.
    std::filesystem::path export_symbol_graph(const export_request& request);

}  // namespace apiguard
