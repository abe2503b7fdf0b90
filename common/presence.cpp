// ============================================================
// presence.cpp -- Discovery datagram codec
// ============================================================

#include "presence.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>

std::vector<u8> proto::encode_presence(const Presence& p) {
    if (p.display_name.empty() || p.display_name.size() > MAX_DISPLAY_NAME) {
        throw std::invalid_argument("display name must be 1-" +
                                    std::to_string(MAX_DISPLAY_NAME) + " bytes");
    }
    if (p.listen_port == 0) {
        throw std::invalid_argument("listen port must be non-zero");
    }

    PresenceHdr hdr{};
    put_magic(hdr.magic, LANSHARE_PRESENCE_MAGIC);
    hdr.version     = p.version;
    hdr.status      = static_cast<u8>(p.status);
    hdr.listen_port = p.listen_port;
    hdr.name_len    = (u16)p.display_name.size();
    hdr.instance_id = p.instance_id;
    encode_presence_hdr(hdr);

    std::vector<u8> out(sizeof(PresenceHdr) + p.display_name.size());
    std::memcpy(out.data(), &hdr, sizeof(hdr));
    std::memcpy(out.data() + sizeof(hdr), p.display_name.data(), p.display_name.size());
    return out;
}

Presence proto::decode_presence(const u8* data, size_t len) {
    if (len < sizeof(PresenceHdr)) {
        throw MalformedDatagram("truncated header (" + std::to_string(len) + " bytes)");
    }
    PresenceHdr hdr;
    std::memcpy(&hdr, data, sizeof(hdr));
    if (!has_magic(hdr.magic, LANSHARE_PRESENCE_MAGIC)) {
        throw MalformedDatagram("bad magic");
    }
    if (hdr.version != LANSHARE_VERSION) {
        throw MalformedDatagram("unsupported version " + std::to_string(hdr.version));
    }
    if (hdr.status > static_cast<u8>(PeerStatus::BUSY)) {
        throw MalformedDatagram("bad status " + std::to_string(hdr.status));
    }
    decode_presence_hdr(hdr);
    if (hdr.listen_port == 0) {
        throw MalformedDatagram("zero listen port");
    }
    if (hdr.name_len == 0 || hdr.name_len > MAX_DISPLAY_NAME) {
        throw MalformedDatagram("bad name length " + std::to_string(hdr.name_len));
    }
    size_t expected = sizeof(PresenceHdr) + hdr.name_len;
    if (len < expected) {
        throw MalformedDatagram("truncated name");
    }
    if (len > expected) {
        throw MalformedDatagram(std::to_string(len - expected) + " trailing bytes");
    }

    Presence p;
    p.version      = hdr.version;
    p.status       = static_cast<PeerStatus>(hdr.status);
    p.listen_port  = hdr.listen_port;
    p.instance_id  = hdr.instance_id;
    p.display_name.assign(reinterpret_cast<const char*>(data + sizeof(PresenceHdr)), hdr.name_len);
    return p;
}
