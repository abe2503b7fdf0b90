#pragma once

// ============================================================
// envelope.hpp -- Handshake envelope and primary-connection frames
//
// Envelope body (big-endian):
//   EnvelopeHdr (48 bytes)
//   sender name  [sender_name_len bytes]
//   file_count x { FileRecord (32 bytes), path [path_len bytes] }
//
// The body travels as the payload of one MT_HANDSHAKE frame, so the
// receiver knows exactly where it ends before any raw file bytes.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include <string>
#include <vector>

class TcpSocket;

struct FileDescriptor {
    std::string   rel_path;         // forward slashes, relative to the send root
    u64           size{0};
    hash::Hash128 checksum{};       // xxh3-128; all zero for directories
    bool          is_directory{false};

    bool operator==(const FileDescriptor& o) const {
        return rel_path == o.rel_path && size == o.size &&
               checksum == o.checksum && is_directory == o.is_directory;
    }
};

struct TransferManifest {
    std::vector<FileDescriptor> files;
    TransferMode mode{TransferMode::SINGLE_STREAM};
    u16          parallelism{1};
    u64          multi_stream_threshold{200ull * 1024 * 1024};
    u64          min_chunk_size{100ull * 1024 * 1024};
    std::string  sender_name;

    u64 total_bytes() const {
        u64 total = 0;
        for (const auto& f : files) total += f.size;
        return total;
    }

    // True when files[i] moves over auxiliary connections
    bool is_chunked(size_t i) const {
        return mode == TransferMode::MULTI_STREAM && is_large(files[i], multi_stream_threshold);
    }

    static bool is_large(const FileDescriptor& f, u64 threshold) {
        return !f.is_directory && f.size > 0 && f.size >= threshold;
    }

    // Multi-stream exactly when some file reaches the threshold
    void select_mode() {
        mode = TransferMode::SINGLE_STREAM;
        for (const auto& f : files) {
            if (is_large(f, multi_stream_threshold)) {
                mode = TransferMode::MULTI_STREAM;
                break;
            }
        }
    }

    bool operator==(const TransferManifest& o) const {
        return files == o.files && mode == o.mode && parallelism == o.parallelism &&
               multi_stream_threshold == o.multi_stream_threshold &&
               min_chunk_size == o.min_chunk_size && sender_name == o.sender_name;
    }
};

struct Reply {
    ReplyToken token{ReplyToken::REJECTED};
    u16        aux_base_port{0};
    u32        wait_ms{0};
    u64        session_id{0};
};

struct Result {
    ResultStatus status{ResultStatus::OK};
    u32          file_index{NO_FILE_INDEX};
    u64          bytes_received{0};
};

const char* reply_token_name(ReplyToken t);

namespace proto {

// Throws ProtocolViolation if the manifest breaks any envelope rule
void validate_manifest(const TransferManifest& m);

// Pure codec for the envelope body
std::vector<u8> encode_envelope(const TransferManifest& m);
TransferManifest decode_envelope(const u8* data, size_t len);

// Framed I/O on the primary connection.
// Readers throw ProtocolViolation on bad frames and ConnectionLost on close.
void write_handshake(TcpSocket& sock, const TransferManifest& m);
TransferManifest read_handshake(TcpSocket& sock);

void write_reply(TcpSocket& sock, const Reply& r);
Reply read_reply(TcpSocket& sock);

void write_complete(TcpSocket& sock, u64 total_bytes, u32 file_count);
CompleteMsg read_complete(TcpSocket& sock);

void write_result(TcpSocket& sock, const Result& r);
Result read_result(TcpSocket& sock);

} // namespace proto
