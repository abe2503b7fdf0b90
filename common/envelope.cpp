// ============================================================
// envelope.cpp -- Handshake envelope codec and control frames
// ============================================================

#include "envelope.hpp"
#include "chunk_plan.hpp"
#include "compress.hpp"
#include "file_io.hpp"
#include "protocol_io.hpp"
#include "socket.hpp"
#include <cstring>
#include <stdexcept>
#include <unordered_map>

const char* reply_token_name(ReplyToken t) {
    switch (t) {
        case ReplyToken::READY:    return "ready";
        case ReplyToken::REJECTED: return "rejected";
        case ReplyToken::TIMEOUT:  return "timeout";
        case ReplyToken::PENDING:  return "pending";
    }
    return "unknown";
}

namespace {

// Bounds-checked sequential reader over a decoded payload
struct Cursor {
    const u8* p;
    size_t    left;

    void take(void* out, size_t n, const char* what) {
        if (n > left) {
            throw ProtocolViolation(std::string("truncated ") + what);
        }
        std::memcpy(out, p, n);
        p += n;
        left -= n;
    }

    std::string take_string(size_t n, const char* what) {
        if (n > left) {
            throw ProtocolViolation(std::string("truncated ") + what);
        }
        std::string s(reinterpret_cast<const char*>(p), n);
        p += n;
        left -= n;
        return s;
    }
};

template <typename T>
void expect_fixed(const std::vector<u8>& payload, const char* what) {
    if (payload.size() != sizeof(T)) {
        throw ProtocolViolation(std::string(what) + " payload is " +
                                std::to_string(payload.size()) + " bytes, expected " +
                                std::to_string(sizeof(T)));
    }
}

void read_expected(TcpSocket& sock, MsgType type, const char* what,
                   FrameHeader& hdr, std::vector<u8>& payload) {
    if (!sock.read_frame(hdr, payload)) {
        throw TransferError(ErrorCode::CONNECTION_LOST,
                            std::string("peer closed the connection while waiting for ") + what);
    }
    if (hdr.msg_type != static_cast<u16>(type)) {
        throw ProtocolViolation(std::string("expected ") + what + ", got msg_type " +
                                std::to_string(hdr.msg_type));
    }
}

// Both separators split components on the receiving side
std::string entry_key(const std::string& rel_path) {
    std::string key = rel_path;
    for (auto& c : key) {
        if (c == '\\') c = '/';
    }
    return key;
}

} // namespace

// ============================================================
// Validation
// ============================================================

void proto::validate_manifest(const TransferManifest& m) {
    if (m.parallelism < 1 || m.parallelism > MAX_PARALLELISM) {
        throw ProtocolViolation("parallelism " + std::to_string(m.parallelism) + " out of range");
    }
    if (m.min_chunk_size == 0) {
        throw ProtocolViolation("min chunk size is zero");
    }
    if (m.files.size() > MAX_MANIFEST_FILES) {
        throw ProtocolViolation("too many files: " + std::to_string(m.files.size()));
    }
    if (m.sender_name.size() > MAX_DISPLAY_NAME) {
        throw ProtocolViolation("sender name too long");
    }

    // Every entry names its own output: no repeats, nothing below a file
    std::unordered_map<std::string, bool> seen;  // key -> is_directory
    for (size_t i = 0; i < m.files.size(); ++i) {
        if (!file_io::is_safe_relative_path(m.files[i].rel_path)) {
            throw ProtocolViolation("unsafe path: " + m.files[i].rel_path);
        }
        if (!seen.emplace(entry_key(m.files[i].rel_path), m.files[i].is_directory).second) {
            throw ProtocolViolation("duplicate path: " + m.files[i].rel_path);
        }
    }
    for (const auto& kv : seen) {
        for (size_t slash = kv.first.find('/'); slash != std::string::npos;
             slash = kv.first.find('/', slash + 1)) {
            auto parent = seen.find(kv.first.substr(0, slash));
            if (parent != seen.end() && !parent->second) {
                throw ProtocolViolation("path below a file entry: " + kv.first);
            }
        }
    }

    bool any_large = false;
    u64 total = 0;
    for (size_t i = 0; i < m.files.size(); ++i) {
        const auto& f = m.files[i];
        if (f.rel_path.size() > MAX_PATH_LEN) {
            throw ProtocolViolation("path too long at entry " + std::to_string(i));
        }
        if (f.is_directory) {
            if (f.size != 0) {
                throw ProtocolViolation("directory entry with non-zero size: " + f.rel_path);
            }
        }
        if (total + f.size < total) {
            throw ProtocolViolation("total size overflows");
        }
        total += f.size;
        if (TransferManifest::is_large(f, m.multi_stream_threshold)) any_large = true;
    }

    bool multi = m.mode == TransferMode::MULTI_STREAM;
    if (multi != any_large) {
        throw ProtocolViolation(std::string("mode ") + (multi ? "multi" : "single") +
                                "-stream inconsistent with threshold " +
                                std::to_string(m.multi_stream_threshold));
    }
    if (chunk_plan::aux_connection_count(m) > MAX_AUX_CONNECTIONS) {
        throw ProtocolViolation("too many auxiliary connections");
    }
}

// ============================================================
// Envelope body
// ============================================================

std::vector<u8> proto::encode_envelope(const TransferManifest& m) {
    validate_manifest(m);

    size_t body = sizeof(EnvelopeHdr) + m.sender_name.size();
    for (const auto& f : m.files) body += sizeof(FileRecord) + f.rel_path.size();
    std::vector<u8> out(body);
    u8* p = out.data();

    EnvelopeHdr hdr{};
    put_magic(hdr.magic, LANSHARE_HANDSHAKE_MAGIC);
    hdr.version                = LANSHARE_VERSION;
    hdr.mode                   = static_cast<u8>(m.mode);
    hdr.parallelism            = m.parallelism;
    hdr.file_count             = (u32)m.files.size();
    hdr.total_bytes            = m.total_bytes();
    hdr.multi_stream_threshold = m.multi_stream_threshold;
    hdr.min_chunk_size         = m.min_chunk_size;
    hdr.sender_name_len        = (u16)m.sender_name.size();
    encode_envelope_hdr(hdr);
    std::memcpy(p, &hdr, sizeof(hdr));
    p += sizeof(hdr);
    std::memcpy(p, m.sender_name.data(), m.sender_name.size());
    p += m.sender_name.size();

    for (const auto& f : m.files) {
        FileRecord rec{};
        rec.file_size = f.size;
        hash::to_bytes(f.checksum, rec.xxh3_128);
        rec.flags    = f.is_directory ? FILE_FLAG_DIRECTORY : 0;
        rec.path_len = (u16)f.rel_path.size();
        encode_file_record(rec);
        std::memcpy(p, &rec, sizeof(rec));
        p += sizeof(rec);
        std::memcpy(p, f.rel_path.data(), f.rel_path.size());
        p += f.rel_path.size();
    }
    return out;
}

TransferManifest proto::decode_envelope(const u8* data, size_t len) {
    Cursor cur{data, len};

    EnvelopeHdr hdr;
    cur.take(&hdr, sizeof(hdr), "envelope header");
    if (!has_magic(hdr.magic, LANSHARE_HANDSHAKE_MAGIC)) {
        throw ProtocolViolation("bad envelope magic");
    }
    if (hdr.version != LANSHARE_VERSION) {
        throw ProtocolViolation("unsupported envelope version " + std::to_string(hdr.version));
    }
    if (hdr.mode > static_cast<u8>(TransferMode::MULTI_STREAM)) {
        throw ProtocolViolation("bad mode " + std::to_string(hdr.mode));
    }
    decode_envelope_hdr(hdr);
    if (hdr.file_count > MAX_MANIFEST_FILES) {
        throw ProtocolViolation("too many files: " + std::to_string(hdr.file_count));
    }
    // Every record needs at least its fixed part; reject before reserving
    if ((u64)hdr.file_count * sizeof(FileRecord) > len) {
        throw ProtocolViolation("file count exceeds payload");
    }

    TransferManifest m;
    m.mode                   = static_cast<TransferMode>(hdr.mode);
    m.parallelism            = hdr.parallelism;
    m.multi_stream_threshold = hdr.multi_stream_threshold;
    m.min_chunk_size         = hdr.min_chunk_size;
    m.sender_name            = cur.take_string(hdr.sender_name_len, "sender name");
    m.files.reserve(hdr.file_count);

    for (u32 i = 0; i < hdr.file_count; ++i) {
        FileRecord rec;
        cur.take(&rec, sizeof(rec), "file record");
        decode_file_record(rec);
        if (rec.flags & ~FILE_FLAG_DIRECTORY) {
            throw ProtocolViolation("unknown file flags at entry " + std::to_string(i));
        }
        FileDescriptor f;
        f.size         = rec.file_size;
        f.checksum     = hash::from_bytes(rec.xxh3_128);
        f.is_directory = (rec.flags & FILE_FLAG_DIRECTORY) != 0;
        f.rel_path     = cur.take_string(rec.path_len, "file path");
        m.files.push_back(std::move(f));
    }

    if (cur.left != 0) {
        throw ProtocolViolation(std::to_string(cur.left) + " trailing bytes after envelope");
    }

    validate_manifest(m);
    if (m.total_bytes() != hdr.total_bytes) {
        throw ProtocolViolation("total bytes " + std::to_string(hdr.total_bytes) +
                                " does not match file sizes (" +
                                std::to_string(m.total_bytes()) + ")");
    }
    return m;
}

// ============================================================
// Framed I/O
// ============================================================

void proto::write_handshake(TcpSocket& sock, const TransferManifest& m) {
    std::vector<u8> body = encode_envelope(m);
    if (body.size() <= ENVELOPE_COMPRESS_THRESHOLD) {
        sock.write_frame(MsgType::MT_HANDSHAKE, 0, body.data(), (u32)body.size());
        return;
    }

    std::vector<u8> packed = compress::compress_to_vec(body.data(), body.size());
    std::vector<u8> payload(4 + packed.size());
    u32 raw_len = hton32((u32)body.size());
    std::memcpy(payload.data(), &raw_len, 4);
    std::memcpy(payload.data() + 4, packed.data(), packed.size());
    if (payload.size() > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("handshake envelope too large: " + std::to_string(payload.size()));
    }
    sock.write_frame(MsgType::MT_HANDSHAKE, FLAG_ZSTD, payload.data(), (u32)payload.size());
}

TransferManifest proto::read_handshake(TcpSocket& sock) {
    FrameHeader hdr;
    std::vector<u8> payload;
    read_expected(sock, MsgType::MT_HANDSHAKE, "handshake", hdr, payload);

    if (hdr.flags & ~FLAG_ZSTD) {
        throw ProtocolViolation("unknown frame flags " + std::to_string(hdr.flags));
    }
    if (!(hdr.flags & FLAG_ZSTD)) {
        return decode_envelope(payload.data(), payload.size());
    }

    if (payload.size() < 4) {
        throw ProtocolViolation("truncated compressed envelope");
    }
    u32 raw_len;
    std::memcpy(&raw_len, payload.data(), 4);
    raw_len = ntoh32(raw_len);
    if (raw_len > MAX_PAYLOAD_LEN) {
        throw ProtocolViolation("compressed envelope expands to " + std::to_string(raw_len) + " bytes");
    }
    std::vector<u8> body;
    try {
        body = compress::decompress_to_vec(payload.data() + 4, payload.size() - 4, raw_len);
    } catch (const std::runtime_error& e) {
        throw ProtocolViolation(e.what());
    }
    return decode_envelope(body.data(), body.size());
}

void proto::write_reply(TcpSocket& sock, const Reply& r) {
    ReplyMsg msg{};
    msg.token         = static_cast<u8>(r.token);
    msg.aux_base_port = r.aux_base_port;
    msg.wait_ms       = r.wait_ms;
    msg.session_id    = r.session_id;
    encode_reply(msg);
    sock.write_frame(MsgType::MT_REPLY, 0, &msg, sizeof(msg));
}

Reply proto::read_reply(TcpSocket& sock) {
    FrameHeader hdr;
    std::vector<u8> payload;
    read_expected(sock, MsgType::MT_REPLY, "reply", hdr, payload);
    expect_fixed<ReplyMsg>(payload, "reply");

    ReplyMsg msg;
    std::memcpy(&msg, payload.data(), sizeof(msg));
    decode_reply(msg);
    if (msg.token > static_cast<u8>(ReplyToken::PENDING)) {
        throw ProtocolViolation("bad reply token " + std::to_string(msg.token));
    }
    Reply r;
    r.token         = static_cast<ReplyToken>(msg.token);
    r.aux_base_port = msg.aux_base_port;
    r.wait_ms       = msg.wait_ms;
    r.session_id    = msg.session_id;
    return r;
}

void proto::write_complete(TcpSocket& sock, u64 total_bytes, u32 file_count) {
    CompleteMsg msg{};
    msg.total_bytes = total_bytes;
    msg.file_count  = file_count;
    encode_complete(msg);
    sock.write_frame(MsgType::MT_COMPLETE, 0, &msg, sizeof(msg));
}

CompleteMsg proto::read_complete(TcpSocket& sock) {
    FrameHeader hdr;
    std::vector<u8> payload;
    read_expected(sock, MsgType::MT_COMPLETE, "completion marker", hdr, payload);
    expect_fixed<CompleteMsg>(payload, "completion marker");

    CompleteMsg msg;
    std::memcpy(&msg, payload.data(), sizeof(msg));
    decode_complete(msg);
    return msg;
}

void proto::write_result(TcpSocket& sock, const Result& r) {
    ResultMsg msg{};
    msg.status         = static_cast<u8>(r.status);
    msg.file_index     = r.file_index;
    msg.bytes_received = r.bytes_received;
    encode_result(msg);
    sock.write_frame(MsgType::MT_RESULT, 0, &msg, sizeof(msg));
}

Result proto::read_result(TcpSocket& sock) {
    FrameHeader hdr;
    std::vector<u8> payload;
    read_expected(sock, MsgType::MT_RESULT, "result", hdr, payload);
    expect_fixed<ResultMsg>(payload, "result");

    ResultMsg msg;
    std::memcpy(&msg, payload.data(), sizeof(msg));
    decode_result(msg);
    if (msg.status > static_cast<u8>(ResultStatus::FAILED)) {
        throw ProtocolViolation("bad result status " + std::to_string(msg.status));
    }
    Result r;
    r.status         = static_cast<ResultStatus>(msg.status);
    r.file_index     = msg.file_index;
    r.bytes_received = msg.bytes_received;
    return r;
}
