#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <libmount/libmount.h>

#include "process.h"
#include "mountpoint.h"

void restore_ownership(const std::filesystem::path& dir, uid_t uid)
{
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(dir, ec), end;
    if (ec) return;
    for (; it != end; it.increment(ec)) {
        if (lchown(it->path().c_str(), uid, (gid_t)-1) < 0 && debug) {
            std::cerr << "Debug: chown(" << it->path().string() << ") failed: " << strerror(errno) << std::endl;
        }
    }
}

MountPoint::MountPoint(const std::string& prefix, std::optional<uid_t> owner) : owner(owner)
{
    std::string tmpdir_rp = prefix + "XXXXXX";
    if (!mkdtemp(tmpdir_rp.data())) {
        throw std::runtime_error("mkdtemp() failed: " + std::string(strerror(errno)));
    }
    tmpdir = tmpdir_rp;
}

void MountPoint::mount(const std::filesystem::path& device, const std::string& fstype, int flags, const std::string& data)
{
    if (mounted) throw std::logic_error(tmpdir.string() + " is already mounted");
    //else
    std::shared_ptr<libmnt_context> ctx(mnt_new_context(), mnt_free_context);
    if (!ctx) throw std::runtime_error("mnt_new_context() failed");
    mnt_context_set_source(ctx.get(), device.c_str());
    mnt_context_set_target(ctx.get(), tmpdir.c_str());
    mnt_context_set_fstype(ctx.get(), fstype.c_str());
    mnt_context_set_mflags(ctx.get(), flags);
    mnt_context_set_options(ctx.get(), data.c_str());

    if (mnt_context_mount(ctx.get()) != 0) {
        throw std::runtime_error("mnt_context_mount() failed");
    }
    if (mnt_context_get_status(ctx.get()) != 1) {
        throw std::runtime_error("bad mount status");
    }
    mounted = true;
}

MountPoint::~MountPoint()
{
    if (owner) restore_ownership(tmpdir, *owner);
    if (umount2(tmpdir.c_str(), MNT_FORCE) < 0 && mounted && debug) {
        std::cerr << "Debug: umount("<< tmpdir.string() << ") failed: " << strerror(errno) << std::endl;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(tmpdir, ec)) std::filesystem::remove(tmpdir, ec);
}
