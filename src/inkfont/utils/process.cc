//
// Created by igor on 19/10/2026.
//

#include <inkfont/utils/process.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace inkfont {
    namespace {
        class spawn_actions {
        public:
            spawn_actions() {
                const int rc = posix_spawn_file_actions_init(&m_actions);
                THROW_IF(rc != 0, std::runtime_error, "posix_spawn_file_actions_init failed: ", std::strerror(rc));
            }

            ~spawn_actions() {
                posix_spawn_file_actions_destroy(&m_actions);
            }

            spawn_actions(const spawn_actions&) = delete;
            spawn_actions& operator=(const spawn_actions&) = delete;

            [[nodiscard]] posix_spawn_file_actions_t* get() noexcept { return &m_actions; }

        private:
            posix_spawn_file_actions_t m_actions{};
        };
    }

    process_result run_process(const std::vector<std::string>& argv, const std::filesystem::path& log_file) {
        THROW_IF(argv.empty(), std::invalid_argument, "run_process needs a program name");

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);

        const std::string log_path = log_file.string();
        spawn_actions actions;
        int rc = posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, log_path.c_str(),
                                                  O_WRONLY | O_CREAT | O_TRUNC, 0644);
        THROW_IF(rc != 0, std::runtime_error, "cannot redirect output to ", log_path, ": ", std::strerror(rc));
        rc = posix_spawn_file_actions_adddup2(actions.get(), STDOUT_FILENO, STDERR_FILENO);
        THROW_IF(rc != 0, std::runtime_error, "cannot redirect stderr: ", std::strerror(rc));

        pid_t pid = 0;
        rc = posix_spawnp(&pid, args[0], actions.get(), nullptr, args.data(), environ);
        THROW_IF(rc != 0, std::runtime_error, "cannot start ", argv[0], ": ", std::strerror(rc));
        LOG_DEBUG("spawned ", argv[0], " pid=", pid);

        int status = 0;
        pid_t waited = 0;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        THROW_IF(waited < 0, std::runtime_error, "waitpid failed for ", argv[0], ": ", std::strerror(errno));

        process_result result;
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
        if (!result.ok()) {
            result.output_tail = read_tail(log_file);
        }
        return result;
    }

    std::string read_tail(const std::filesystem::path& file, std::size_t max_bytes) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return {};
        }
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (text.size() > max_bytes) {
            text.erase(0, text.size() - max_bytes);
        }
        return text;
    }
}  // namespace inkfont
