#pragma once

#include <stdexcept>
#include <string>

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_PRIVILEGE = 2,
    EXIT_DECLINED = 3,
    EXIT_PROVISIONING = 10
};

// bad arguments, non-block device, missing local inputs
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// user did not confirm
class Aborted : public std::runtime_error {
public:
    Aborted() : std::runtime_error("User aborted installation") {}
};

class NoProviderError : public std::runtime_error {
public:
    explicit NoProviderError(const std::string& what) : std::runtime_error(what) {}
};

class Interrupted : public std::runtime_error {
    int signo;
public:
    explicit Interrupted(int signo)
        : std::runtime_error("Interrupted by signal " + std::to_string(signo)), signo(signo) {}
    int signal() const { return signo; }
    int exit_code() const { return 128 + signo; }
};
