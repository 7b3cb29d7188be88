#include <unistd.h>

#include <iostream>

#include <argparse/argparse.hpp>

#include "errors.h"
#include "process.h"
#include "blockdev.h"
#include "bootloader.h"
#include "installer.h"

int main(int argc, char** argv)
{
    const std::string progname = "mbusb-install";
    argparse::ArgumentParser program(progname);
    program.add_description("Prepare a multiboot USB drive");
    program.add_argument("device").help("Device to modify (e.g. /dev/sdb)").nargs(argparse::nargs_pattern::any);
    program.add_argument("-y", "--yes").help("Don't ask questions").default_value(false).implicit_value(true);
    program.add_argument("--list").help("List removable disks and exit").default_value(false).implicit_value(true);
    program.add_argument("--source-dir").help("Directory containing mbusb.cfg, mbusb.d and grub.cfg.example")
        .default_value(std::string("."));
    program.add_argument("--label").help("Volume label of the FAT filesystem");
    program.add_argument("--memdisk-archive").help("Use local syslinux release tarball instead of downloading it");
    program.add_argument("--syslinux-url").help("URL of syslinux release tarball").default_value(syslinux_url);
    program.add_argument("--debug").help("Show debug messages").default_value(false).implicit_value(true);

    if (argc < 2) {
        std::cout << program << std::endl;
        return EXIT_OK;
    }

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << program << std::endl;
        return EXIT_USAGE;
    }

    debug = program.get<bool>("--debug");

    if (program.get<bool>("--list")) {
        try {
            print_installable_disks();
            return EXIT_OK;
        }
        catch (const std::exception& ex) {
            std::cerr << ex.what() << std::endl;
            return EXIT_USAGE;
        }
    }

    std::optional<std::filesystem::path> device;
    try {
        if (auto args = program.present<std::vector<std::string>>("device")) {
            for (const auto& arg:*args) {
                device = validate_device_argument(progname, arg);
            }
        }
    }
    catch (const UsageError& ex) {
        std::cerr << ex.what() << std::endl;
        return EXIT_USAGE;
    }
    if (!device) {
        std::cerr << progname << ": No device was provided." << std::endl;
        std::cerr << program << std::endl;
        return EXIT_USAGE;
    }

    if (geteuid() != 0) {
        std::cerr << "This program must be run as root. Using sudo..." << std::endl;
        reexec_with_sudo(argc, argv);
        return EXIT_PRIVILEGE;
    }

    try {
        install_termination_handlers();

        auto memdisk_archive = program.present("--memdisk-archive");
        RunContext ctx {
            .device = *device,
            .grub_install = resolve_grub_installer(),
            .source_dir = std::filesystem::absolute(program.get<std::string>("--source-dir")),
            .owner = invoking_user(),
            .label = program.present("--label"),
            .memdisk = {
                .url = program.get<std::string>("--syslinux-url"),
                .archive = memdisk_archive? std::make_optional(std::filesystem::absolute(*memdisk_archive)) : std::nullopt
            },
            .yes = program.get<bool>("--yes")
        };
        if (debug) {
            std::cerr << "Debug: GRUB installer " << ctx.grub_install.string() << std::endl;
            std::cerr << "Debug: files owned by " << (ctx.owner? ctx.owner->name : std::string("root")) << std::endl;
        }
        check_local_inputs(ctx.source_dir);

        install_to_device(ctx, std::cin);
        return EXIT_OK;
    }
    catch (const std::exception&) {
        return failure_exit_code(progname, std::current_exception());
    }
}
