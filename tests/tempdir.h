#pragma once

#include <stdlib.h>
#include <sys/stat.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

class TempDir {
    std::filesystem::path dir;
public:
    TempDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "mbusb-test-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp() failed");
        dir = tmpl;
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    const std::filesystem::path& path() const { return dir; }
    std::filesystem::path operator/(const std::filesystem::path& other) const { return dir / other; }
};

inline void write_file(const std::filesystem::path& path, const std::string& content, mode_t mode = 0644)
{
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream f(path);
        f << content;
    }
    chmod(path.c_str(), mode);
}

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream f(path);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}
