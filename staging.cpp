#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "errors.h"
#include "staging.h"

const std::vector<std::string>& required_inputs()
{
    static const std::vector<std::string> inputs = { "mbusb.cfg", "mbusb.d", "grub.cfg.example" };
    return inputs;
}

void check_local_inputs(const std::filesystem::path& source_dir)
{
    std::string missing;
    for (const auto& input:required_inputs()) {
        auto path = source_dir / input;
        bool ok = (input == "mbusb.d")? std::filesystem::is_directory(path) : std::filesystem::is_regular_file(path);
        if (ok) continue;
        if (!missing.empty()) missing += ", ";
        missing += path.string();
    }
    if (!missing.empty()) throw UsageError("Required files not found: " + missing);
}

GrubDirLookup find_grub_dir(const std::filesystem::path& boot_dir)
{
    GrubDirLookup lookup { GrubDirLookup::NONE, {} };
    std::error_code ec;
    for (const auto& entry: std::filesystem::directory_iterator(boot_dir, ec)) {
        if (!entry.is_directory()) continue;
        if (entry.path().filename().string().rfind("grub", 0) != 0) continue;
        lookup.candidates.push_back(entry.path());
    }
    std::sort(lookup.candidates.begin(), lookup.candidates.end());
    if (lookup.candidates.size() == 1) lookup.status = GrubDirLookup::FOUND;
    else if (lookup.candidates.size() > 1) lookup.status = GrubDirLookup::MULTIPLE;
    return lookup;
}

std::filesystem::path require_grub_dir(const std::filesystem::path& boot_dir)
{
    auto lookup = find_grub_dir(boot_dir);
    switch (lookup.status) {
    case GrubDirLookup::FOUND:
        return lookup.candidates.front();
    case GrubDirLookup::NONE:
        throw std::runtime_error("No GRUB directory found under " + boot_dir.string());
    case GrubDirLookup::MULTIPLE:
        break;
    }
    std::string names;
    for (const auto& c:lookup.candidates) {
        names += ' ' + c.filename().string();
    }
    throw std::runtime_error("More than one GRUB directory found under " + boot_dir.string() + ":" + names);
}

std::filesystem::path stage_files(const std::filesystem::path& source_dir, const std::filesystem::path& boot_dir)
{
    std::filesystem::create_directories(boot_dir / "isos");
    auto grub_dir = require_grub_dir(boot_dir);

    const auto opts = std::filesystem::copy_options::recursive | std::filesystem::copy_options::overwrite_existing;
    std::filesystem::copy_file(source_dir / "mbusb.cfg", grub_dir / "mbusb.cfg", std::filesystem::copy_options::overwrite_existing);
    std::filesystem::create_directories(grub_dir / "mbusb.d");
    std::filesystem::copy(source_dir / "mbusb.d", grub_dir / "mbusb.d", opts);
    std::filesystem::copy_file(source_dir / "grub.cfg.example", grub_dir / "grub.cfg.example", std::filesystem::copy_options::overwrite_existing);
    std::filesystem::copy_file(grub_dir / "grub.cfg.example", grub_dir / "grub.cfg", std::filesystem::copy_options::overwrite_existing);
    return grub_dir;
}

const std::vector<Provider>& http_clients()
{
    static const std::vector<Provider> clients = {
        { "wget", {"-qO", "-"} },
        { "curl", {"-sL"} }
    };
    return clients;
}

std::vector<std::string> tar_extract_args(const std::filesystem::path& dest, const std::string& archive)
{
    return {
        "-xz", "-f", archive, "-C", dest.string(),
        "--no-same-owner", "--strip-components", "3",
        memdisk_member
    };
}

void fetch_memdisk(const std::filesystem::path& grub_dir, const MemdiskSource& source, const std::string& search_path)
{
    const auto memdisk = grub_dir / "memdisk";
    if (source.archive) {
        if (!std::filesystem::is_regular_file(*source.archive)) {
            throw std::runtime_error(source.archive->string() + " does not exist or not a regular file");
        }
        //else
        if (exec("tar", tar_extract_args(grub_dir, source.archive->string())) != 0) {
            throw std::runtime_error("Failed to extract memdisk from " + source.archive->string());
        }
    } else {
        bool any_client = false, fetched = false;
        // a failing client falls through to the next one
        for (const auto& client:http_clients()) {
            auto path = find_in_path(client.name, search_path);
            if (!path) continue;
            //else
            any_client = true;
            std::error_code ec;
            std::filesystem::remove(memdisk, ec); // leftover of a failed attempt
            auto args = client.args;
            args.push_back(source.url);
            auto status = exec_pipeline(path->string(), args, "tar", tar_extract_args(grub_dir));
            if (status.ok() && std::filesystem::is_regular_file(memdisk)) {
                fetched = true;
                break;
            }
            std::cerr << "Warning: fetching " << source.url << " with " << client.name << " failed." << std::endl;
        }
        if (!any_client) throw std::runtime_error("Neither wget nor curl was found.");
        if (!fetched) throw std::runtime_error("Failed to fetch memdisk from " + source.url);
    }
    if (!std::filesystem::is_regular_file(memdisk)) {
        throw std::runtime_error("memdisk was not extracted to " + grub_dir.string());
    }
}
