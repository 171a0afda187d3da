#include "dotenvpp/infra/process.hpp"
#include "dotenvpp/core/logger.hpp"

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace dotenvpp::infra {

namespace {

auto to_c_array(const std::vector<std::string>& items) -> std::vector<char*> {
    std::vector<char*> result;
    result.reserve(items.size() + 1);
    for (const auto& item : items) {
        result.push_back(const_cast<char*>(item.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

} // anonymous namespace

auto run_process(const std::string& command,
                 const std::vector<std::string>& args,
                 const std::vector<std::string>& env) -> Result<int> {
    if (command.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "No command given"));
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(command);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    // Built before fork so the child only calls async-signal-safe functions.
    auto argv = to_c_array(argv_storage);
    auto envp = to_c_array(env);

    LOG_DEBUG("Launching {} with {} argument(s)", command, args.size());

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
                                          "Failed to fork process", std::strerror(errno)));
    }

    if (pid == 0) {
        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(kExecFailedStatus);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(make_error(ErrorCode::ProcessError,
                                              "Failed to wait for " + command,
                                              std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        auto code = WEXITSTATUS(status);
        LOG_DEBUG("{} exited with status {}", command, code);
        return code;
    }
    if (WIFSIGNALED(status)) {
        auto sig = WTERMSIG(status);
        LOG_WARN("{} terminated by signal {}", command, sig);
        return 128 + sig;
    }

    return std::unexpected(make_error(ErrorCode::ProcessError,
                                      "Unexpected wait status for " + command));
}

} // namespace dotenvpp::infra
