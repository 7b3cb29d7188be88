#include <stdexcept>

#include "errors.h"
#include "bootloader.h"

const std::vector<Provider>& grub_installers()
{
    static const std::vector<Provider> installers = {
        { "grub2-install", {} }, // Fedora, openSUSE
        { "grub-install", {} }
    };
    return installers;
}

std::filesystem::path resolve_grub_installer(const std::string& search_path)
{
    auto installer = resolve_provider(grub_installers(), search_path);
    if (!installer) throw NoProviderError("Neither grub2-install nor grub-install was found.");
    return installer->path;
}

std::vector<std::string> efi_grub_install_args(const std::filesystem::path& mount_dir)
{
    return {
        "--target=x86_64-efi",
        "--efi-directory=" + mount_dir.string(),
        "--boot-directory=" + (mount_dir / boot_subdir).string(),
        "--removable", "--recheck"
    };
}

std::vector<std::string> bios_grub_install_args(const std::filesystem::path& mount_dir, const std::filesystem::path& disk)
{
    return {
        "--target=i386-pc",
        "--boot-directory=" + (mount_dir / boot_subdir).string(),
        "--recheck", disk.string()
    };
}

void install_efi_bootloader(const std::filesystem::path& grub_install, const std::filesystem::path& mount_dir)
{
    if (exec(grub_install.string(), efi_grub_install_args(mount_dir)) != 0) {
        throw std::runtime_error("grub-install(EFI) failed");
    }
}

void install_bios_bootloader(const std::filesystem::path& grub_install, const std::filesystem::path& mount_dir,
    const std::filesystem::path& disk)
{
    if (exec(grub_install.string(), bios_grub_install_args(mount_dir, disk)) != 0) {
        throw std::runtime_error("grub-install(BIOS) failed");
    }
}
