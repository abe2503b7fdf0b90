// ============================================================
// manifest_builder.cpp -- Recursive send-list expansion
// ============================================================

#include "manifest_builder.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

ManifestBuilder::ManifestBuilder(const EngineConfig& cfg)
    : cfg_(cfg) {}

void ManifestBuilder::add_entry(const fs::path& abs, const std::string& rel, bool is_dir) {
    Entry e;
    e.rel_path     = rel;
    e.abs_path     = is_dir ? std::string() : abs.string();
    e.is_directory = is_dir;
    e.size         = is_dir ? 0 : file_io::get_file_size(abs.string());
    total_bytes_ += e.size;
    entries_.push_back(std::move(e));
}

void ManifestBuilder::add(const std::string& path) {
    std::error_code ec;
    fs::path root = fs::absolute(fs::path(path), ec).lexically_normal();
    if (ec || !fs::exists(root, ec)) {
        throw TransferError(ErrorCode::FILE_IO, "No such file or directory: " + path);
    }
    // "dir/" normalizes to a trailing empty component
    if (root.filename().empty()) root = root.parent_path();

    std::string top = root.filename().string();
    if (top.empty() || !names_.insert(top).second) {
        throw std::invalid_argument("Duplicate or unnamed send entry: " + path);
    }

    if (!fs::is_directory(root, ec)) {
        add_entry(root, top, false);
        return;
    }

    size_t first = entries_.size();
    add_entry(root, top, true);
    for (auto it = fs::recursive_directory_iterator(root,
                       fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code sub_ec;
        fs::path rel = fs::relative(entry.path(), root, sub_ec);
        if (sub_ec) continue;
        std::string rel_path = top + "/" + rel.generic_string();
        if (entry.is_directory(sub_ec)) {
            add_entry(entry.path(), rel_path, true);
        } else if (entry.is_regular_file(sub_ec)) {
            add_entry(entry.path(), rel_path, false);
        }
    }
    if (ec) {
        throw TransferError(ErrorCode::FILE_IO, "Cannot scan " + path + ": " + ec.message());
    }

    // Directory iteration order is unspecified; parents sort before children
    std::sort(entries_.begin() + (std::ptrdiff_t)first, entries_.end(),
              [](const Entry& a, const Entry& b) { return a.rel_path < b.rel_path; });
}

SendList ManifestBuilder::build() {
    SendList out;
    TransferManifest& m = out.manifest;
    m.parallelism            = cfg_.max_workers;
    m.multi_stream_threshold = cfg_.multi_stream_threshold;
    m.min_chunk_size         = cfg_.min_chunk_size;
    m.sender_name            = cfg_.display_name.empty() ? platform::host_name() : cfg_.display_name;
    if (m.sender_name.size() > MAX_DISPLAY_NAME) m.sender_name.resize(MAX_DISPLAY_NAME);

    u64 t0 = utils::now_ms();
    m.files.reserve(entries_.size());
    out.sources.reserve(entries_.size());
    for (const auto& e : entries_) {
        FileDescriptor f;
        f.rel_path     = e.rel_path;
        f.size         = e.size;
        f.is_directory = e.is_directory;
        if (!e.is_directory) {
            f.checksum = file_io::hash_file(e.abs_path, cfg_.buffer_size);
        }
        m.files.push_back(std::move(f));
        out.sources.push_back(e.abs_path);
    }
    m.select_mode();
    proto::validate_manifest(m);

    LOG_INFO("Manifest: " + std::to_string(m.files.size()) + " entries, " +
             utils::format_bytes(m.total_bytes()) + ", " +
             (m.mode == TransferMode::MULTI_STREAM ? "multi" : "single") + "-stream, hashed in " +
             std::to_string(utils::now_ms() - t0) + " ms");
    return out;
}
