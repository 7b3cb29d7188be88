#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#include "errors.h"
#include "session.h"

std::optional<User> lookup_user(const std::string& name)
{
    if (name.empty()) return std::nullopt;
    //else
    struct passwd pwd;
    struct passwd* result = nullptr;
    std::vector<char> buf(16384);
    if (getpwnam_r(name.c_str(), &pwd, buf.data(), buf.size(), &result) != 0 || !result) {
        return std::nullopt;
    }
    return User { result->pw_name, result->pw_uid, result->pw_gid };
}

std::optional<std::string> invoking_user_name()
{
    if (auto sudo_user = getenv("SUDO_USER")) return std::string(sudo_user);
    //else
    if (auto login = getlogin()) return std::string(login);
    //else
    return std::nullopt;
}

std::optional<User> invoking_user()
{
    auto name = invoking_user_name();
    if (!name) return std::nullopt;
    return lookup_user(*name);
}

void reexec_with_sudo(int argc, char** argv)
{
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    std::string self_str = ec? std::string(argv[0]) : self.string();

    std::vector<char*> sudo_argv = {
        const_cast<char*>("sudo"), const_cast<char*>("-k"), const_cast<char*>("--"),
        self_str.data()
    };
    for (int i = 1; i < argc; i++) {
        sudo_argv.push_back(argv[i]);
    }
    sudo_argv.push_back(nullptr);
    execvp("sudo", sudo_argv.data());
    std::cerr << "sudo: " << strerror(errno) << std::endl;
}

bool is_affirmative(const std::string& answer)
{
    auto begin = std::find_if_not(answer.begin(), answer.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(answer.rbegin(), answer.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return false;
    //else
    std::string word(begin, end);
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });
    return word == "y" || word == "yes";
}

bool ask_yes_no(const std::string& question, std::istream& in, std::ostream& out)
{
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) return false;
    return is_affirmative(answer);
}

void confirm_device(const std::filesystem::path& device, std::istream& in, std::ostream& out)
{
    if (!ask_yes_no("Are you sure you want to use " + device.string() + "?", in, out)) throw Aborted();
    if (!ask_yes_no("THIS WILL DELETE ALL DATA ON THE DEVICE. Are you sure?", in, out)) throw Aborted();
}
