#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "process.h"

static const std::string boot_subdir("boot");

const std::vector<Provider>& grub_installers();
// throws NoProviderError when no installer is on the search path
std::filesystem::path resolve_grub_installer(const std::string& search_path = default_search_path());

std::vector<std::string> efi_grub_install_args(const std::filesystem::path& mount_dir);
std::vector<std::string> bios_grub_install_args(const std::filesystem::path& mount_dir, const std::filesystem::path& disk);

void install_efi_bootloader(const std::filesystem::path& grub_install, const std::filesystem::path& mount_dir);
void install_bios_bootloader(const std::filesystem::path& grub_install, const std::filesystem::path& mount_dir,
    const std::filesystem::path& disk);
