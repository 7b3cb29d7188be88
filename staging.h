#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "process.h"

static const std::string syslinux_url("https://mirrors.edge.kernel.org/pub/linux/utils/boot/syslinux/syslinux-6.03.tar.gz");
static const std::string memdisk_member("syslinux-6.03/bios/memdisk/memdisk");

const std::vector<std::string>& required_inputs();
// throws UsageError naming every missing input
void check_local_inputs(const std::filesystem::path& source_dir);

struct GrubDirLookup {
    enum Status { FOUND, NONE, MULTIPLE };
    Status status;
    std::vector<std::filesystem::path> candidates; // sorted
};

// directories named grub* right under boot_dir
GrubDirLookup find_grub_dir(const std::filesystem::path& boot_dir);
std::filesystem::path require_grub_dir(const std::filesystem::path& boot_dir);

// creates boot/isos, copies the configuration into the GRUB directory and returns that directory
std::filesystem::path stage_files(const std::filesystem::path& source_dir, const std::filesystem::path& boot_dir);

struct MemdiskSource {
    std::string url = syslinux_url;
    std::optional<std::filesystem::path> archive; // local copy of the release tarball
};

const std::vector<Provider>& http_clients();
std::vector<std::string> tar_extract_args(const std::filesystem::path& dest, const std::string& archive = "-");
// HTTP clients are tried in order until one of them delivers the archive
void fetch_memdisk(const std::filesystem::path& grub_dir, const MemdiskSource& source = {},
    const std::string& search_path = default_search_path());
