#include <unistd.h>

#include "errors.h"
#include "process.h"
#include "blockdev.h"
#include "mountpoint.h"
#include "bootloader.h"
#include "installer.h"

static const std::string mount_prefix("/tmp/mbusb.");

static std::string mount_options(const std::optional<User>& owner)
{
    if (!owner) return "";
    //else
    return "uid=" + std::to_string(owner->uid) + ",gid=" + std::to_string(owner->gid);
}

void install_to_device(const RunContext& ctx, std::istream& in)
{
    unmount_device(ctx.device);
    print_device_summary(ctx.device);

    if (!ctx.yes) {
        try {
            confirm_device(ctx.device, in, std::cout);
        }
        catch (const Aborted&) {
            check_interrupted(); // a signal interrupting the prompt is not a decline
            throw;
        }
    }
    check_interrupted();

    set_command_trace(true);

    std::cout << "Creating partition table on " << ctx.device.string() << "..." << std::endl;
    create_partition_table(ctx.device);
    check_interrupted();

    auto partition = find_partition(ctx.device, 1);
    if (!partition) {
        throw std::runtime_error("There is no " + partition_candidates(ctx.device, 1) + " in your system");
    }

    std::cout << "Formatting " << partition->string() << " with FAT..." << std::endl;
    auto uuid = format_fat(*partition, ctx.label);
    std::cout << "Done. UUID=" << uuid << std::endl;

    {
        MountPoint mnt(mount_prefix, ctx.owner? std::make_optional(ctx.owner->uid) : std::nullopt);
        std::cout << "Mounting " << partition->string() << "..." << std::flush;
        mnt.mount(*partition, "vfat", MS_RELATIME, mount_options(ctx.owner));
        std::cout << "Done." << std::endl;

        std::cout << "Installing EFI bootloader..." << std::endl;
        install_efi_bootloader(ctx.grub_install, mnt);
        std::cout << "Installing BIOS bootloader..." << std::endl;
        install_bios_bootloader(ctx.grub_install, mnt, ctx.device);

        std::cout << "Copying configuration files..." << std::flush;
        auto grub_dir = stage_files(ctx.source_dir, mnt / boot_subdir);
        std::cout << "Done." << std::endl;

        std::cout << "Installing memdisk..." << std::endl;
        fetch_memdisk(grub_dir, ctx.memdisk);
        check_interrupted();
        sync();
    }
    std::cout << "Multiboot USB drive prepared successfully." << std::endl;
}

int failure_exit_code(const std::string& progname, std::exception_ptr failure)
{
    try {
        std::rethrow_exception(failure);
    }
    catch (const UsageError& ex) {
        std::cerr << progname << ": " << ex.what() << std::endl;
        return EXIT_USAGE;
    }
    catch (const Aborted&) {
        return EXIT_DECLINED;
    }
    catch (const NoProviderError& ex) {
        std::cerr << progname << ": " << ex.what() << std::endl;
        return EXIT_DECLINED;
    }
    catch (const Interrupted& ex) {
        std::cerr << ex.what() << std::endl;
        return ex.exit_code();
    }
    catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
    }
    return EXIT_PROVISIONING;
}
