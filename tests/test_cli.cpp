#include <gtest/gtest.h>

#include "process.h"
#include "tempdir.h"

struct CliResult {
    int status;
    std::string out;
    std::string err;
};

// runs the installed binary with stdin closed off, capturing both streams
static CliResult run_cli(const std::vector<std::string>& args)
{
    TempDir tmp;
    std::vector<std::string> sh_args = {
        "-c", "o=$1 e=$2; shift 2; exec \"$0\" \"$@\" >\"$o\" 2>\"$e\" </dev/null",
        MBUSB_INSTALL_PATH, (tmp / "out").string(), (tmp / "err").string()
    };
    sh_args.insert(sh_args.end(), args.begin(), args.end());
    CliResult result;
    result.status = exec("sh", sh_args);
    result.out = read_file(tmp / "out");
    result.err = read_file(tmp / "err");
    return result;
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

TEST(CliTest, NoArgumentsPrintsUsage)
{
    auto r = run_cli({});
    EXPECT_EQ(r.status, 0);
    EXPECT_TRUE(contains(r.out, "Usage:")) << r.out;
}

TEST(CliTest, HelpExitsZero)
{
    auto r = run_cli({"-h"});
    EXPECT_EQ(r.status, 0);
    EXPECT_TRUE(contains(r.out, "--memdisk-archive")) << r.out;
}

TEST(CliTest, CharacterDeviceIsRejectedBeforeAnyPrompt)
{
    auto r = run_cli({"/dev/null"});
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "mbusb-install: /dev/null is not a valid device.")) << r.err;
    EXPECT_FALSE(contains(r.out, "Are you sure"));
}

TEST(CliTest, NonDevicePathIsRejected)
{
    auto r = run_cli({"foo"});
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "mbusb-install: foo is not a valid argument.")) << r.err;
}

TEST(CliTest, OptionsWithoutDeviceAreRejected)
{
    auto r = run_cli({"--debug"});
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "mbusb-install: No device was provided.")) << r.err;
}
