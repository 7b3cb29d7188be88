#include <gtest/gtest.h>

#include "process.h"
#include "tempdir.h"

TEST(ExecTest, ReturnsExitStatus)
{
    EXPECT_EQ(exec("true", {}), 0);
    EXPECT_EQ(exec("false", {}), 1);
    EXPECT_EQ(exec("sh", {"-c", "exit 7"}), 7);
}

TEST(ExecTest, MissingCommandFails)
{
    EXPECT_EQ(exec("mbusb-no-such-command", {}), 127);
}

TEST(ExecTest, CommandLineQuotesArgumentsWithSpaces)
{
    EXPECT_EQ(command_line("parted", {"--script", "/dev/sdb", "mklabel msdos"}),
        "parted --script /dev/sdb 'mklabel msdos'");
    EXPECT_EQ(command_line("mkfs.vfat", {"/dev/sdb1"}), "mkfs.vfat /dev/sdb1");
    EXPECT_EQ(command_line("echo", {""}), "echo ''");
}

TEST(PipelineTest, ConnectsProducerToConsumer)
{
    auto status = exec_pipeline("echo", {"hello"}, "sh", {"-c", "read x && test \"$x\" = hello"});
    EXPECT_EQ(status.producer, 0);
    EXPECT_EQ(status.consumer, 0);
    EXPECT_TRUE(status.ok());
}

TEST(PipelineTest, ReportsEachSideSeparately)
{
    auto status = exec_pipeline("false", {}, "cat", {});
    EXPECT_NE(status.producer, 0);
    EXPECT_EQ(status.consumer, 0);
    EXPECT_FALSE(status.ok());

    status = exec_pipeline("echo", {"data"}, "sh", {"-c", "cat > /dev/null; exit 3"});
    EXPECT_EQ(status.producer, 0);
    EXPECT_EQ(status.consumer, 3);
    EXPECT_FALSE(status.ok());
}

TEST(FindInPathTest, FindsExecutableOnly)
{
    TempDir tmp;
    write_file(tmp / "bin/tool", "#!/bin/sh\n", 0755);
    write_file(tmp / "bin/data", "plain", 0644);
    const auto search_path = (tmp / "missing").string() + ":" + (tmp / "bin").string();

    auto found = find_in_path("tool", search_path);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, tmp / "bin/tool");
    EXPECT_FALSE(find_in_path("data", search_path).has_value());
    EXPECT_FALSE(find_in_path("absent", search_path).has_value());
    EXPECT_FALSE(find_in_path("", search_path).has_value());
}

TEST(FindInPathTest, NameWithSlashIsCheckedDirectly)
{
    TempDir tmp;
    write_file(tmp / "tool", "#!/bin/sh\n", 0755);
    auto found = find_in_path((tmp / "tool").string(), "/nonexistent");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, tmp / "tool");
}

TEST(ResolveProviderTest, PrefersEarlierProvider)
{
    TempDir tmp;
    write_file(tmp / "a/second", "", 0755);
    write_file(tmp / "b/first", "", 0755);
    write_file(tmp / "b/second", "", 0755);
    const std::vector<Provider> providers = { {"first", {"-x"}}, {"second", {}} };

    auto resolved = resolve_provider(providers, (tmp / "a").string() + ":" + (tmp / "b").string());
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->provider.name, "first");
    EXPECT_EQ(resolved->provider.args, std::vector<std::string>{"-x"});
    EXPECT_EQ(resolved->path, tmp / "b/first");
}

TEST(ResolveProviderTest, FallsBackAndReportsAbsence)
{
    TempDir tmp;
    write_file(tmp / "a/second", "", 0755);
    const std::vector<Provider> providers = { {"first", {}}, {"second", {}} };

    auto resolved = resolve_provider(providers, (tmp / "a").string());
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->provider.name, "second");

    EXPECT_FALSE(resolve_provider(providers, (tmp / "empty").string()).has_value());
}

TEST(SignalTest, NothingPendingByDefault)
{
    EXPECT_NO_THROW(check_interrupted());
}
