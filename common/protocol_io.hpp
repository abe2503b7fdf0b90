#pragma once

// ============================================================
// protocol_io.hpp -- Frame header and struct byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <stdexcept>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host<->network) ----

inline void encode_presence_hdr(PresenceHdr& h) {
    h.listen_port = hton16(h.listen_port);
    h.name_len    = hton16(h.name_len);
    h.instance_id = hton64(h.instance_id);
}

inline void decode_presence_hdr(PresenceHdr& h) {
    h.listen_port = ntoh16(h.listen_port);
    h.name_len    = ntoh16(h.name_len);
    h.instance_id = ntoh64(h.instance_id);
}

inline void encode_envelope_hdr(EnvelopeHdr& h) {
    h.parallelism            = hton16(h.parallelism);
    h.file_count             = hton32(h.file_count);
    h.total_bytes            = hton64(h.total_bytes);
    h.multi_stream_threshold = hton64(h.multi_stream_threshold);
    h.min_chunk_size         = hton64(h.min_chunk_size);
    h.sender_name_len        = hton16(h.sender_name_len);
}

inline void decode_envelope_hdr(EnvelopeHdr& h) {
    h.parallelism            = ntoh16(h.parallelism);
    h.file_count             = ntoh32(h.file_count);
    h.total_bytes            = ntoh64(h.total_bytes);
    h.multi_stream_threshold = ntoh64(h.multi_stream_threshold);
    h.min_chunk_size         = ntoh64(h.min_chunk_size);
    h.sender_name_len        = ntoh16(h.sender_name_len);
}

inline void encode_file_record(FileRecord& r) {
    r.file_size = hton64(r.file_size);
    r.path_len  = hton16(r.path_len);
}

inline void decode_file_record(FileRecord& r) {
    r.file_size = ntoh64(r.file_size);
    r.path_len  = ntoh16(r.path_len);
}

inline void encode_reply(ReplyMsg& m) {
    m.aux_base_port = hton16(m.aux_base_port);
    m.wait_ms       = hton32(m.wait_ms);
    m.session_id    = hton64(m.session_id);
}

inline void decode_reply(ReplyMsg& m) {
    m.aux_base_port = ntoh16(m.aux_base_port);
    m.wait_ms       = ntoh32(m.wait_ms);
    m.session_id    = ntoh64(m.session_id);
}

inline void encode_complete(CompleteMsg& m) {
    m.total_bytes = hton64(m.total_bytes);
    m.file_count  = hton32(m.file_count);
}

inline void decode_complete(CompleteMsg& m) {
    m.total_bytes = ntoh64(m.total_bytes);
    m.file_count  = ntoh32(m.file_count);
}

inline void encode_result(ResultMsg& m) {
    m.file_index     = hton32(m.file_index);
    m.bytes_received = hton64(m.bytes_received);
}

inline void decode_result(ResultMsg& m) {
    m.file_index     = ntoh32(m.file_index);
    m.bytes_received = ntoh64(m.bytes_received);
}

} // namespace proto
