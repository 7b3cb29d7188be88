#pragma once

#include <sys/types.h>
#include <sys/mount.h>

#include <filesystem>
#include <optional>
#include <string>

// Recursively hands the contents of dir (not dir itself) to uid. Errors are ignored.
void restore_ownership(const std::filesystem::path& dir, uid_t uid);

// Temporary mount directory. The destructor always runs the cleanup sequence:
// ownership restore (if an owner was given), forced unmount, directory removal.
class MountPoint {
    std::filesystem::path tmpdir;
    std::optional<uid_t> owner;
    bool mounted = false;
public:
    MountPoint() = delete;
    MountPoint(const MountPoint&) = delete;
    MountPoint& operator=(const MountPoint&) = delete;
    explicit MountPoint(const std::string& prefix, std::optional<uid_t> owner = std::nullopt);
    ~MountPoint();

    void mount(const std::filesystem::path& device, const std::string& fstype = "auto",
        int flags = MS_RELATIME, const std::string& data = "");
    bool is_mounted() const { return mounted; }

    const std::filesystem::path& path() const {
        return tmpdir;
    }
    operator std::filesystem::path() const {
        return tmpdir;
    }
    std::filesystem::path operator/(const std::filesystem::path& other) const {
        return tmpdir / other;
    }
};
