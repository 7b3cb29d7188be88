#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <iostream>

#include "errors.h"
#include "process.h"

bool debug = false;

static bool trace = false;
static volatile sig_atomic_t pending_signal = 0;

static void on_termination(int sig)
{
    pending_signal = sig;
}

void install_termination_handlers()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_termination;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART so that waitpid() returns on a signal
    for (auto sig : {SIGHUP, SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) < 0) throw std::runtime_error("sigaction() failed");
    }
}

void check_interrupted()
{
    if (pending_signal) throw Interrupted(pending_signal);
}

void set_command_trace(bool enabled)
{
    trace = enabled;
}

std::string command_line(const std::string& cmd, const std::vector<std::string>& args)
{
    std::string line = cmd;
    for (const auto& arg:args) {
        line += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'$") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

static int wait_child(pid_t pid)
{
    int rst;
    bool terminated = false;
    while (waitpid(pid, &rst, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid() failed: ") + strerror(errno));
        //else
        if (pending_signal && !terminated) {
            kill(pid, SIGTERM);
            terminated = true;
        }
    }
    return WIFEXITED(rst)? WEXITSTATUS(rst) : -1;
}

static void exec_child(const std::string& cmd, const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.c_str()));
    for (const auto& arg:args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    execvp(cmd.c_str(), argv.data());
    std::cerr << cmd << ": " << strerror(errno) << std::endl;
    _exit(127);
}

int fork(std::function<int()> func)
{
    check_interrupted(); // nothing is started once a termination signal is latched
    pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error("fork() failed.");
    if (pid == 0) { //child
        _exit(func());
    }
    //else
    auto rst = wait_child(pid);
    check_interrupted();
    return rst;
}

int exec(const std::string& cmd, const std::vector<std::string>& args)
{
    if (trace) std::cerr << "+ " << command_line(cmd, args) << std::endl;
    return fork([&cmd,&args]() {
        exec_child(cmd, args);
        return -1;
    });
}

PipelineStatus exec_pipeline(const std::string& producer, const std::vector<std::string>& producer_args,
    const std::string& consumer, const std::vector<std::string>& consumer_args)
{
    check_interrupted();
    if (trace) {
        std::cerr << "+ " << command_line(producer, producer_args)
            << " | " << command_line(consumer, consumer_args) << std::endl;
    }
    int fd[2];
    if (pipe(fd) < 0) throw std::runtime_error("pipe() failed.");

    pid_t consumer_pid = ::fork();
    if (consumer_pid < 0) {
        close(fd[0]);
        close(fd[1]);
        throw std::runtime_error("fork() failed.");
    }
    if (consumer_pid == 0) { //child
        close(fd[1]);
        dup2(fd[0], STDIN_FILENO);
        close(fd[0]);
        exec_child(consumer, consumer_args);
    }
    //else
    pid_t producer_pid = ::fork();
    if (producer_pid < 0) {
        close(fd[0]);
        close(fd[1]);
        wait_child(consumer_pid);
        throw std::runtime_error("fork() failed.");
    }
    if (producer_pid == 0) { //child
        close(fd[0]);
        dup2(fd[1], STDOUT_FILENO);
        close(fd[1]);
        exec_child(producer, producer_args);
    }
    //else
    close(fd[0]);
    close(fd[1]);

    PipelineStatus status;
    status.producer = wait_child(producer_pid);
    status.consumer = wait_child(consumer_pid);
    check_interrupted();
    return status;
}

std::string default_search_path()
{
    const char* path = getenv("PATH");
    return path? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
}

static bool is_executable(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_in_path(const std::string& name, const std::string& search_path)
{
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return std::filesystem::path(name);
        //else
        return std::nullopt;
    }
    //else
    std::string::size_type offset = 0;
    while (true) {
        auto pos = search_path.find(':', offset);
        auto dir = search_path.substr(offset, pos == std::string::npos? std::string::npos : pos - offset);
        auto candidate = std::filesystem::path(dir.empty()? "." : dir) / name;
        if (is_executable(candidate)) return candidate;
        if (pos == std::string::npos) break;
        offset = pos + 1;
    }
    return std::nullopt;
}

std::optional<ResolvedProvider> resolve_provider(const std::vector<Provider>& providers, const std::string& search_path)
{
    for (const auto& provider:providers) {
        auto path = find_in_path(provider.name, search_path);
        if (path) return ResolvedProvider { provider, *path };
    }
    return std::nullopt;
}
