#include <sys/wait.h>
#include <sys/mount.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <regex>
#include <set>

#include <ext/stdio_filebuf.h> // for __gnu_cxx::stdio_filebuf
#include <libmount/libmount.h>
#include <blkid/blkid.h>

#include "errors.h"
#include "process.h"
#include "blockdev.h"

static std::string unescape(const std::string& str)
{
    std::regex expr("\\\\x[0-9a-fA-F][0-9a-fA-F]");
    std::smatch m;
    auto s = str;
    std::string result;
    while (std::regex_search(s, m, expr)) {
        result += m.prefix();
        const auto& mstr = m[0].str();
        auto hex2dec = [](int hex) {
            if (hex >= '0' && hex <= '9') return hex - '0';
            //else
            if (hex >= 'A' && hex <= 'F') return hex - 'A' + 10;
            //else
            throw std::runtime_error("Invalid hex char");
        };
        result += (char)(hex2dec(std::toupper(mstr[2])) * 16 + hex2dec(std::toupper(mstr[3])));
        s = m.suffix();
    }
    result += s;
    return result;
}

std::optional<BlockDevice> parse_lsblk_line(const std::string& line)
{
    std::vector<std::string> splitted;
    std::string::size_type offset = 0;
    while(true) {
        auto pos = line.find(' ', offset);
        if (pos == std::string::npos) {
            splitted.push_back(unescape(line.substr(offset)));
            break;
        }
        //else
        splitted.push_back(unescape(line.substr(offset, pos - offset)));
        offset = pos + 1;
    }
    if (splitted.size() != 10) return std::nullopt; // line is incomplete
    //else
    try {
        return BlockDevice {
            splitted[0],
            splitted[1],
            splitted[2],
            splitted[3],
            splitted[4] != ""? std::make_optional(splitted[4]) : std::nullopt,
            std::stoi(splitted[5]) > 0,
            std::stoi(splitted[6]) > 0,
            splitted[7] != ""? std::make_optional(splitted[7]) : std::nullopt,
            std::stoull(splitted[8]),
            splitted[9]
        };
    }
    catch (const std::logic_error&) { // stoi/stoull on malformed column
        return std::nullopt;
    }
}

std::list<BlockDevice> lsblk(const std::optional<std::filesystem::path>& device)
{
    int fd[2];
    if (pipe(fd) < 0) throw std::runtime_error("pipe() failed.");

    pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error("fork() failed.");

    int rst;
    std::list<BlockDevice> devices;
    bool failed = false;

    if (pid == 0) { //child
        close(fd[0]);
        dup2(fd[1], STDOUT_FILENO);
        if (execlp("lsblk", "lsblk", "-bnr", "-o", "PATH,NAME,MODEL,TYPE,PKNAME,RO,RM,MOUNTPOINT,SIZE,TRAN",
            device? device.value().c_str() : nullptr, nullptr) < 0) _exit(-1);
    } else { // parent
        close(fd[1]);
        try {
            __gnu_cxx::stdio_filebuf<char> filebuf(fd[0], std::ios::in);
            std::istream f(&filebuf);
            std::string line;
            while (std::getline(f, line)) {
                auto d = parse_lsblk_line(line);
                if (d) devices.push_back(*d);
            }
        }
        catch (const std::runtime_error& ex) { failed = true; }
        // filebuf closes fd[0]
    }

    while (waitpid(pid, &rst, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error("waitpid() failed");
    }

    if (failed || !WIFEXITED(rst) || WEXITSTATUS(rst) != 0) throw std::runtime_error("lsblk failed");

    return devices;
}

std::string size_str(uint64_t size)
{
    uint64_t gib = 1024L * 1024 * 1024;
    auto tib = gib * 1024;
    char buf[32];
    if (size >= tib) {
        snprintf(buf, sizeof(buf), "%.1fTiB", (double)size / tib);
        return buf;
    }
    //else
    if (size < gib) {
        snprintf(buf, sizeof(buf), "%.1fMiB", (double)size / (1024 * 1024));
        return buf;
    }
    //else
    snprintf(buf, sizeof(buf), "%.1fGiB", (double)size / gib);
    return buf;
}

std::list<BlockDevice> installable_disks(const std::list<BlockDevice>& devices)
{
    std::set<std::string> disks_to_be_excluded;
    for (const auto& d:devices) {
        if (d.mountpoint) {
            disks_to_be_excluded.insert(d.name);
            if (d.pkname) disks_to_be_excluded.insert(*d.pkname);
        }
        if (d.ro || !d.rm || d.size == 0/* no medium */ || d.type != "disk") {
            disks_to_be_excluded.insert(d.name);
        }
    }
    std::list<BlockDevice> disks;
    for (const auto& d:devices) {
        if (disks_to_be_excluded.find(d.name) != disks_to_be_excluded.end()) continue;
        disks.push_back(d);
    }
    return disks;
}

void print_installable_disks()
{
    auto disks = installable_disks(lsblk());
    std::cout << "Available disks:" << std::endl;
    for (const auto& d:disks) {
        std::cout << d.path.string() << '\t' << d.model << '\t' << d.tran << '\t' << size_str(d.size) << std::endl;
    }
}

void print_device_summary(const std::filesystem::path& device)
{
    std::list<BlockDevice> devices;
    try {
        devices = lsblk(device);
    }
    catch (const std::runtime_error& ex) {
        if (debug) std::cerr << "Debug: " << ex.what() << std::endl;
        return;
    }
    if (devices.empty()) return;
    //else
    const auto& disk_info = devices.front(); // the first one is the disk itself
    std::cout << "Device path: " << device.string() << std::endl;
    if (!disk_info.model.empty()) std::cout << "Disk model: " << disk_info.model << std::endl;
    std::cout << "Disk size: " << size_str(disk_info.size) << std::endl;
    if (!disk_info.tran.empty()) std::cout << "Transport: " << disk_info.tran << std::endl;
    if (!disk_info.rm) std::cout << "Warning: " << device.string() << " is not a removable device." << std::endl;
}

bool is_block_device(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_block_file(path, ec);
}

std::filesystem::path validate_device_argument(const std::string& progname, const std::string& arg)
{
    if (arg.rfind("/dev/", 0) != 0) {
        throw UsageError(progname + ": " + arg + " is not a valid argument.");
    }
    //else
    if (!is_block_device(arg)) {
        throw UsageError(progname + ": " + arg + " is not a valid device.");
    }
    return arg;
}

bool belongs_to_device(const std::string& source, const std::filesystem::path& device)
{
    const auto& prefix = device.string();
    return !prefix.empty() && source.compare(0, prefix.size(), prefix) == 0;
}

void unmount_device(const std::filesystem::path& device)
{
    std::shared_ptr<libmnt_table> tb(mnt_new_table_from_file("/proc/self/mountinfo"), mnt_unref_table);
    if (!tb) {
        if (debug) std::cerr << "Debug: unable to read mount table" << std::endl;
        return;
    }
    std::shared_ptr<libmnt_iter> itr(mnt_new_iter(MNT_ITER_BACKWARD), mnt_free_iter);
    if (!itr) return;

    std::vector<std::string> targets;
    struct libmnt_fs* fs;
    while (mnt_table_next_fs(tb.get(), itr.get(), &fs) == 0) {
        auto source = mnt_fs_get_source(fs);
        auto target = mnt_fs_get_target(fs);
        if (source && target && belongs_to_device(source, device)) targets.push_back(target);
    }
    for (const auto& target:targets) {
        if (umount2(target.c_str(), MNT_FORCE) < 0 && debug) {
            std::cerr << "Debug: umount(" << target << ") failed: " << strerror(errno) << std::endl;
        }
    }
}

std::vector<std::string> parted_args(const std::filesystem::path& disk, const PartitionRequest& request)
{
    return {
        "--script", disk.string(),
        "mklabel " + request.label,
        "mkpart " + request.part_type + ' ' + request.fs_type + ' ' + request.start + ' ' + request.end,
        "print"
    };
}

void create_partition_table(const std::filesystem::path& disk, const PartitionRequest& request)
{
    auto rst = exec("parted", parted_args(disk, request));
    if (rst != 0) {
        std::cerr << "Warning: parted exited with status " << rst << ", continuing." << std::endl;
    }
    exec("udevadm", {"settle"});
}

std::string partition_candidates(const std::filesystem::path& disk, int num)
{
    const auto n = std::to_string(num);
    return disk.string() + n + " or " + disk.string() + 'p' + n;
}

std::optional<std::filesystem::path> find_partition(const std::filesystem::path& disk, int num,
    const std::filesystem::path& dev_dir)
{
    const auto n = std::to_string(num);
    const auto plain = disk.string() + n;
    const auto with_p = disk.string() + 'p' + n;

    std::error_code ec;
    std::vector<std::filesystem::path> matches;
    for (const auto& entry: std::filesystem::directory_iterator(dev_dir, ec)) {
        auto candidate = (dev_dir / entry.path().filename()).string();
        if (candidate == plain || candidate == with_p) matches.push_back(candidate);
    }
    if (ec) throw std::runtime_error("Unable to list " + dev_dir.string() + ": " + ec.message());
    if (matches.empty()) return std::nullopt;
    //else
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

std::vector<std::string> mkfs_vfat_args(const std::filesystem::path& partition, const std::optional<std::string>& label)
{
    std::vector<std::string> mkfs_args;
    if (label) {
        mkfs_args.push_back("-n");
        mkfs_args.push_back(label.value());
    }
    mkfs_args.push_back(partition.string());
    return mkfs_args;
}

std::string format_fat(const std::filesystem::path& partition, const std::optional<std::string>& label)
{
    if (exec("mkfs.vfat", mkfs_vfat_args(partition, label)) != 0) {
        throw std::runtime_error("Unable to format partition " + partition.string() + " by FAT");
    }
    //else
    blkid_cache cache;
    if (blkid_get_cache(&cache, "/dev/null") != 0) throw std::runtime_error("blkid_get_cache() failed");
    if (blkid_probe_all(cache) != 0) {
        blkid_put_cache(cache);
        throw std::runtime_error("blkid_probe_all() failed");
    }
    auto tag_value = blkid_get_tag_value(cache, "UUID", partition.c_str());
    std::optional<std::string> uuid = (tag_value)? std::make_optional(tag_value) : std::nullopt;
    free(tag_value);
    blkid_put_cache(cache);
    if (!uuid) throw std::runtime_error("Failed to get UUID of partition " + partition.string());
    return uuid.value();
}
