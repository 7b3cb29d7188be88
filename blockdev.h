#pragma once

#include <cstdint>
#include <filesystem>
#include <list>
#include <optional>
#include <string>
#include <vector>

struct BlockDevice {
    std::filesystem::path path;
    std::string name;
    std::string model;
    std::string type;
    std::optional<std::string> pkname;
    bool ro;
    bool rm;
    std::optional<std::string> mountpoint;
    uint64_t size;
    std::string tran;
};

// one row of `lsblk -bnr -o PATH,NAME,MODEL,TYPE,PKNAME,RO,RM,MOUNTPOINT,SIZE,TRAN`
std::optional<BlockDevice> parse_lsblk_line(const std::string& line);
std::list<BlockDevice> lsblk(const std::optional<std::filesystem::path>& device = std::nullopt);

std::string size_str(uint64_t size);

// removable, writable, non-empty whole disks none of whose partitions is mounted
std::list<BlockDevice> installable_disks(const std::list<BlockDevice>& devices);
void print_installable_disks();
void print_device_summary(const std::filesystem::path& device);

bool is_block_device(const std::filesystem::path& path);

// Accepts a /dev/* block device; throws UsageError otherwise.
std::filesystem::path validate_device_argument(const std::string& progname, const std::string& arg);

// true when a mount source lies under the device path prefix (the disk itself or one of its partitions)
bool belongs_to_device(const std::string& source, const std::filesystem::path& device);
// best effort: forced unmount of everything mounted from the device, errors ignored
void unmount_device(const std::filesystem::path& device);

struct PartitionRequest {
    std::string label = "msdos";
    std::string part_type = "primary";
    std::string fs_type = "fat32";
    std::string start = "1MiB";
    std::string end = "100%";
};

std::vector<std::string> parted_args(const std::filesystem::path& disk, const PartitionRequest& request = {});
// partitioner failures are reported but tolerated; the partition lookup that follows catches a bad table
void create_partition_table(const std::filesystem::path& disk, const PartitionRequest& request = {});

// "/dev/sdb1 or /dev/sdbp1", for messages
std::string partition_candidates(const std::filesystem::path& disk, int num);
std::optional<std::filesystem::path> find_partition(const std::filesystem::path& disk, int num,
    const std::filesystem::path& dev_dir = "/dev");

std::vector<std::string> mkfs_vfat_args(const std::filesystem::path& partition,
    const std::optional<std::string>& label = std::nullopt);
// returns UUID of the new filesystem
std::string format_fat(const std::filesystem::path& partition, const std::optional<std::string>& label = std::nullopt);
