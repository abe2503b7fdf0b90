#pragma once

// ============================================================
// manifest_builder.hpp -- Send list -> TransferManifest
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/envelope.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

// Manifest plus the local source of every entry (empty for directories)
struct SendList {
    TransferManifest         manifest;
    std::vector<std::string> sources;
};

class ManifestBuilder {
public:
    explicit ManifestBuilder(const EngineConfig& cfg);

    // Add a file, or a directory with everything below it. The top-level
    // entry is named after the last path component.
    // Throws TransferError(FILE_IO) when the path does not exist and
    // std::invalid_argument when the name collides with an earlier entry.
    void add(const std::string& path);

    // Hash every file, choose the mode and validate the result
    SendList build();

    u32 total_files() const { return (u32)entries_.size(); }
    u64 total_bytes() const { return total_bytes_; }

private:
    struct Entry {
        std::string rel_path;
        std::string abs_path;
        u64         size{0};
        bool        is_directory{false};
    };

    void add_entry(const std::filesystem::path& abs, const std::string& rel, bool is_dir);

    const EngineConfig&   cfg_;
    std::vector<Entry>    entries_;
    std::set<std::string> names_;
    u64                   total_bytes_{0};
};
