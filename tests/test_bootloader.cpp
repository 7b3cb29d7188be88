#include <gtest/gtest.h>

#include "errors.h"
#include "bootloader.h"
#include "tempdir.h"

TEST(GrubInstallArgsTest, Efi)
{
    std::vector<std::string> expected = {
        "--target=x86_64-efi",
        "--efi-directory=/tmp/mbusb.abc123",
        "--boot-directory=/tmp/mbusb.abc123/boot",
        "--removable", "--recheck"
    };
    EXPECT_EQ(efi_grub_install_args("/tmp/mbusb.abc123"), expected);
}

TEST(GrubInstallArgsTest, BiosTargetsWholeDisk)
{
    std::vector<std::string> expected = {
        "--target=i386-pc",
        "--boot-directory=/tmp/mbusb.abc123/boot",
        "--recheck", "/dev/sdb"
    };
    EXPECT_EQ(bios_grub_install_args("/tmp/mbusb.abc123", "/dev/sdb"), expected);
}

TEST(GrubInstallerTest, Grub2NameComesFirst)
{
    const auto& installers = grub_installers();
    ASSERT_EQ(installers.size(), 2u);
    EXPECT_EQ(installers[0].name, "grub2-install");
    EXPECT_EQ(installers[1].name, "grub-install");
}

TEST(GrubInstallerTest, ResolvesFromSearchPath)
{
    TempDir tmp;
    write_file(tmp / "debian/grub-install", "", 0755);
    write_file(tmp / "fedora/grub2-install", "", 0755);

    EXPECT_EQ(resolve_grub_installer((tmp / "debian").string()), tmp / "debian/grub-install");
    EXPECT_EQ(resolve_grub_installer((tmp / "debian").string() + ":" + (tmp / "fedora").string()),
        tmp / "fedora/grub2-install");
}

TEST(GrubInstallerTest, NoInstallerIsTypedFailure)
{
    TempDir tmp;
    EXPECT_THROW(resolve_grub_installer(tmp.path().string()), NoProviderError);
}

TEST(GrubInstallTest, FailingInstallerThrows)
{
    TempDir tmp;
    write_file(tmp / "grub-install", "#!/bin/sh\nexit 1\n", 0755);
    EXPECT_THROW(install_efi_bootloader(tmp / "grub-install", tmp.path()), std::runtime_error);
    EXPECT_THROW(install_bios_bootloader(tmp / "grub-install", tmp.path(), "/dev/sdb"), std::runtime_error);
}

TEST(GrubInstallTest, InstallerReceivesArguments)
{
    TempDir tmp;
    write_file(tmp / "grub-install", "#!/bin/sh\necho \"$@\" >> \"$(dirname \"$0\")/calls\"\n", 0755);
    install_efi_bootloader(tmp / "grub-install", tmp / "mnt");
    install_bios_bootloader(tmp / "grub-install", tmp / "mnt", "/dev/sdb");

    auto mnt = (tmp / "mnt").string();
    EXPECT_EQ(read_file(tmp / "calls"),
        "--target=x86_64-efi --efi-directory=" + mnt + " --boot-directory=" + mnt + "/boot --removable --recheck\n"
        "--target=i386-pc --boot-directory=" + mnt + "/boot --recheck /dev/sdb\n");
}
