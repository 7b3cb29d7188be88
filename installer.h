#pragma once

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "session.h"
#include "staging.h"

struct RunContext {
    std::filesystem::path device;
    std::filesystem::path grub_install;
    std::filesystem::path source_dir;
    std::optional<User> owner;
    std::optional<std::string> label;
    MemdiskSource memdisk;
    bool yes{};
};

// unmount, confirm, partition, format, install both GRUB targets, stage files and memdisk
void install_to_device(const RunContext& ctx, std::istream& in);

// Reports a failure that escaped install_to_device() and maps it to the process exit status:
// UsageError 1, Aborted and NoProviderError 3, Interrupted 128+signal, anything else 10.
int failure_exit_code(const std::string& progname, std::exception_ptr failure);
