#pragma once

// protocol.hpp -- Wire protocol definitions for LanShare

#include "platform.hpp"
#include <cstring>

// Magic numbers: "LSP1" (presence datagram), "LSH1" (handshake envelope)
static constexpr u32 LANSHARE_PRESENCE_MAGIC  = 0x4C535031u;
static constexpr u32 LANSHARE_HANDSHAKE_MAGIC = 0x4C534831u;
static constexpr u8  LANSHARE_VERSION = 1;

static constexpr u16 DEFAULT_DISCOVERY_PORT = 5000;
static constexpr u16 DEFAULT_LISTEN_PORT    = 12345;

static constexpr u32 MAX_PAYLOAD_LEN     = 64u * 1024u * 1024u;
static constexpr u32 DEFAULT_BUFFER_SIZE = 64u * 1024u;
static constexpr u32 MAX_BUFFER_SIZE     = 16u * 1024u * 1024u;
static constexpr u16 MAX_PARALLELISM     = 64;
// Upper bound on auxiliary connections per session (sum over all large files)
static constexpr u32 MAX_AUX_CONNECTIONS = 256;
static constexpr u32 MAX_MANIFEST_FILES  = 1u << 20;
static constexpr u16 MAX_PATH_LEN        = 4096;
static constexpr u16 MAX_DISPLAY_NAME    = 64;
// Envelope bodies larger than this are sent zstd-compressed
static constexpr u32 ENVELOPE_COMPRESS_THRESHOLD = 64u * 1024u;

// ---- Message Types (primary connection) ----
enum class MsgType : u16 {
    MT_HANDSHAKE = 0x0001,  // sender->receiver: transfer envelope
    MT_REPLY     = 0x0002,  // receiver->sender: ready | rejected | timeout
    MT_COMPLETE  = 0x0010,  // sender->receiver: every byte of the session written
    MT_RESULT    = 0x0011,  // receiver->sender: verification outcome
};

// ---- Frame flags ----
static constexpr u16 FLAG_ZSTD = 0x0001;  // payload = u32 raw_len + zstd frame

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

enum class PeerStatus : u8 {
    IDLE = 0,
    BUSY = 1,
};

enum class TransferMode : u8 {
    SINGLE_STREAM = 0,
    MULTI_STREAM  = 1,
};

enum class ReplyToken : u8 {
    READY    = 0,
    REJECTED = 1,
    TIMEOUT  = 2,
    PENDING  = 3,   // held for a decision; wait_ms bounds the wait
};

enum class ResultStatus : u8 {
    OK                = 0,
    CHECKSUM_MISMATCH = 1,
    FAILED            = 2,
};

// FileRecord.flags
static constexpr u8 FILE_FLAG_DIRECTORY = 0x01;

static constexpr u32 NO_FILE_INDEX = 0xFFFFFFFFu;

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// PresenceHdr: 20 bytes fixed + display name
struct PresenceHdr {
    u8  magic[4];
    u8  version;
    u8  status;
    u16 listen_port;
    u16 name_len;
    u8  pad[2];
    u64 instance_id;
};
static_assert(sizeof(PresenceHdr) == 20, "PresenceHdr size mismatch");

// EnvelopeHdr: 48 bytes fixed + sender name + file_count x (FileRecord + path)
struct EnvelopeHdr {
    u8  magic[4];
    u8  version;
    u8  mode;
    u16 parallelism;
    u32 file_count;
    u8  pad[4];
    u64 total_bytes;
    u64 multi_stream_threshold;
    u64 min_chunk_size;
    u16 sender_name_len;
    u8  pad2[6];
};
static_assert(sizeof(EnvelopeHdr) == 48, "EnvelopeHdr size mismatch");

// FileRecord: 32 bytes fixed + relative path
struct FileRecord {
    u64 file_size;
    u8  xxh3_128[16];
    u8  flags;
    u8  pad;
    u16 path_len;
    u8  pad2[4];
};
static_assert(sizeof(FileRecord) == 32, "FileRecord size mismatch");

// ReplyMsg: 16 bytes
struct ReplyMsg {
    u8  token;
    u8  pad;
    u16 aux_base_port;
    u32 wait_ms;
    u64 session_id;
};
static_assert(sizeof(ReplyMsg) == 16, "ReplyMsg size mismatch");

// CompleteMsg: 16 bytes
struct CompleteMsg {
    u64 total_bytes;
    u32 file_count;
    u8  pad[4];
};
static_assert(sizeof(CompleteMsg) == 16, "CompleteMsg size mismatch");

// ResultMsg: 16 bytes
struct ResultMsg {
    u8  status;
    u8  pad[3];
    u32 file_index;
    u64 bytes_received;
};
static_assert(sizeof(ResultMsg) == 16, "ResultMsg size mismatch");

#pragma pack(pop)

// ---- Inline helpers ----
inline void put_magic(u8 out[4], u32 magic) {
    out[0] = (u8)(magic >> 24); out[1] = (u8)(magic >> 16);
    out[2] = (u8)(magic >>  8); out[3] = (u8)(magic);
}

inline bool has_magic(const u8 in[4], u32 magic) {
    return in[0] == (u8)(magic >> 24) && in[1] == (u8)(magic >> 16) &&
           in[2] == (u8)(magic >>  8) && in[3] == (u8)(magic);
}
