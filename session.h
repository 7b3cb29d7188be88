#pragma once

#include <sys/types.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

struct User {
    std::string name;
    uid_t uid;
    gid_t gid;
};

std::optional<User> lookup_user(const std::string& name);
// SUDO_USER, falling back to the login name of the controlling terminal
std::optional<std::string> invoking_user_name();
std::optional<User> invoking_user();

// Replaces the process with `sudo -k -- <self> args...`. Returns only if the exec failed.
void reexec_with_sudo(int argc, char** argv);

// case-insensitive "y" or "yes", surrounding whitespace ignored
bool is_affirmative(const std::string& answer);
bool ask_yes_no(const std::string& question, std::istream& in, std::ostream& out);
// both prompts must be answered affirmatively, otherwise Aborted is thrown
void confirm_device(const std::filesystem::path& device, std::istream& in, std::ostream& out);
