#include "apiguard/exporter.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"
#include "apiguard/utils.hpp"

#include "internal/io.hpp"

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace apiguard::literals;

namespace apiguard {

    namespace detail {

        static constexpr auto symbols_suffix = ".symbols.json"sv;
        static constexpr auto poll_interval = std::chrono::milliseconds{20};

        static int open_write_file(const fs::path& path) {
            auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
            if (fd < 0) {
                throw guard_error(error_kind::io_error, "failed to open file for write: {}"_format(path.string()));
            }
            return fd;
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static void kill_and_reap(pid_t pid) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }

        // <target>.symbols.json or <target>@<platform>.symbols.json
        static bool matches_target_export(std::string_view filename, std::string_view target) {
            if (!filename.ends_with(symbols_suffix) || !filename.starts_with(target)) {
                return false;
            }
            auto rest = filename.substr(target.size());
            return rest == symbols_suffix || (rest.size() > symbols_suffix.size() && rest.front() == '@');
        }

        static std::optional<fs::path> find_newest_export(const fs::path& dir, std::string_view target) {
            std::optional<fs::path> newest{};
            fs::file_time_type newest_time{};

            std::error_code ec{};
            for (fs::directory_iterator it{dir, ec}, end{}; !ec && it != end; it.increment(ec)) {
                if (!it->is_regular_file(ec)) {
                    continue;
                }
                auto name = it->path().filename().string();
                if (!matches_target_export(name, target)) {
                    continue;
                }
                auto mtime = it->last_write_time(ec);
                if (ec) {
                    ec.clear();
                    continue;
                }
                if (!newest || mtime > newest_time ||
                    (mtime == newest_time && name > newest->filename().string())) {
                    newest = it->path();
                    newest_time = mtime;
                }
            }
            if (ec) {
                throw guard_error(
                        error_kind::export_unavailable,
                        "failed to list symbol graph directory {}: {}"_format(dir.string(), ec.message()));
            }
            return newest;
        }

        static std::string captured_output(const fs::path& stdout_path, const fs::path& stderr_path) {
            auto out = internal::io::try_read_text_file(stdout_path).value_or(std::string{});
            auto err = internal::io::try_read_text_file(stderr_path).value_or(std::string{});
            return out + err;
        }

    }  // namespace detail

    process_result run_process(
            const std::vector<std::string>& args,
            const fs::path& stdout_path,
            const fs::path& stderr_path,
            std::chrono::milliseconds timeout) {
        if (args.empty()) {
            throw guard_error(error_kind::export_unavailable, "empty command");
        }

        auto stdout_fd = detail::open_write_file(stdout_path);
        int stderr_fd = -1;
        try {
            stderr_fd = detail::open_write_file(stderr_path);
        } catch (...) {
            ::close(stdout_fd);
            throw;
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_fd);
            ::close(stderr_fd);
            throw guard_error(error_kind::export_unavailable, "fork failed");
        }

        if (pid == 0) {
            // own process group so a timeout can take down the whole tree
            ::setpgid(0, 0);
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }

            ::close(stdout_fd);
            ::close(stderr_fd);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(stdout_fd);
        ::close(stderr_fd);

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            int status = 0;
            auto rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid) {
                return process_result{.exit_code = detail::decode_wait_status(status), .timed_out = false};
            }
            if (rc < 0 && errno != EINTR) {
                detail::kill_and_reap(pid);
                throw guard_error(error_kind::export_unavailable, "waitpid failed");
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                detail::kill_and_reap(pid);
                return process_result{.exit_code = -1, .timed_out = true};
            }
            std::this_thread::sleep_for(detail::poll_interval);
        }
    }

    fs::path export_symbol_graph(const export_request& request) {
        auto per_target_out = request.output_dir / request.target;
        std::error_code ec{};
        fs::remove_all(per_target_out, ec);
        internal::io::ensure_dir(per_target_out);

        auto stdout_path = per_target_out / "export.stdout";
        auto stderr_path = per_target_out / "export.stderr";

        debug_log("running export: ", utils::join_with_separator(request.command, " "));
        auto result = run_process(request.command, stdout_path, stderr_path, request.timeout);

        if (result.timed_out) {
            throw guard_error(
                    error_kind::export_unavailable,
                    "export for {} exceeded {}ms timeout"_format(request.target, request.timeout.count()));
        }
        if (result.exit_code != 0) {
            throw guard_error(
                    error_kind::export_unavailable,
                    "export tool failed ({})\n{}"_format(
                            result.exit_code, detail::captured_output(stdout_path, stderr_path)));
        }

        if (!fs::is_directory(request.symbol_graph_dir, ec)) {
            throw guard_error(
                    error_kind::export_unavailable,
                    "symbol graph directory not found: {}"_format(request.symbol_graph_dir.string()));
        }

        auto newest = detail::find_newest_export(request.symbol_graph_dir, request.target);
        if (!newest) {
            throw guard_error(
                    error_kind::export_unavailable,
                    "no {} produced for target {}"_format(detail::symbols_suffix, request.target));
        }

        auto destination = per_target_out / "{}{}"_format(request.target, detail::symbols_suffix);
        fs::copy_file(*newest, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw guard_error(
                    error_kind::io_error,
                    "failed to copy {} to {}: {}"_format(newest->string(), destination.string(), ec.message()));
        }

        debug_log("exported ", newest->string(), " -> ", destination.string());
        return destination;
    }

}  // namespace apiguard
