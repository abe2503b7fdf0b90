#pragma once

// ============================================================
// presence.hpp -- Discovery datagram codec (no I/O)
//
// Layout (big-endian): PresenceHdr (20 bytes) + UTF-8 display name
// of exactly name_len bytes. Nothing may follow the name.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

struct Presence {
    std::string display_name;
    u16         listen_port{0};
    PeerStatus  status{PeerStatus::IDLE};
    u64         instance_id{0};
    u8          version{LANSHARE_VERSION};
};

namespace proto {

// Throws std::invalid_argument if the name is empty/too long or the port is 0
std::vector<u8> encode_presence(const Presence& p);

// Throws MalformedDatagram on any deviation from the layout above
Presence decode_presence(const u8* data, size_t len);

inline Presence decode_presence(const std::vector<u8>& buf) {
    return decode_presence(buf.data(), buf.size());
}

} // namespace proto
