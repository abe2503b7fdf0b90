// ============================================================
// test_codec.cpp -- Presence datagram and handshake envelope codecs
// ============================================================

#include "../common/envelope.hpp"
#include "../common/presence.hpp"
#include "../common/socket.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <thread>

// ---------------------------------------------------------------
// Presence
// ---------------------------------------------------------------

static Presence sample_presence() {
    Presence p;
    p.display_name = "kitchen-laptop";
    p.listen_port  = 12345;
    p.status       = PeerStatus::BUSY;
    p.instance_id  = 0x0102030405060708ull;
    return p;
}

TEST(PresenceCodecTest, RoundTrip) {
    Presence in = sample_presence();
    std::vector<u8> bytes = proto::encode_presence(in);
    ASSERT_EQ(bytes.size(), sizeof(PresenceHdr) + in.display_name.size());
    EXPECT_EQ(std::memcmp(bytes.data(), "LSP1", 4), 0);

    Presence out = proto::decode_presence(bytes);
    EXPECT_EQ(out.display_name, in.display_name);
    EXPECT_EQ(out.listen_port, in.listen_port);
    EXPECT_EQ(out.status, in.status);
    EXPECT_EQ(out.instance_id, in.instance_id);
    EXPECT_EQ(out.version, LANSHARE_VERSION);
}

TEST(PresenceCodecTest, FieldsAreBigEndian) {
    std::vector<u8> bytes = proto::encode_presence(sample_presence());
    EXPECT_EQ(bytes[6], 0x30);  // 12345 = 0x3039
    EXPECT_EQ(bytes[7], 0x39);
    EXPECT_EQ(bytes[12], 0x01);
    EXPECT_EQ(bytes[19], 0x08);
}

TEST(PresenceCodecTest, EncodeRefusesBadInput) {
    Presence p = sample_presence();
    p.display_name.clear();
    EXPECT_THROW(proto::encode_presence(p), std::invalid_argument);
    p.display_name = std::string(MAX_DISPLAY_NAME + 1, 'x');
    EXPECT_THROW(proto::encode_presence(p), std::invalid_argument);
    p = sample_presence();
    p.listen_port = 0;
    EXPECT_THROW(proto::encode_presence(p), std::invalid_argument);
}

TEST(PresenceCodecTest, RejectsEveryMalformedFixture) {
    const std::vector<u8> good = proto::encode_presence(sample_presence());

    std::vector<std::vector<u8>> fixtures;
    fixtures.push_back({});                                            // empty
    fixtures.push_back(std::vector<u8>(good.begin(), good.begin() + 10));  // truncated header
    fixtures.push_back(std::vector<u8>(good.begin(), good.end() - 1));     // truncated name

    auto patched = [&](size_t at, u8 value) {
        std::vector<u8> v = good;
        v[at] = value;
        return v;
    };
    fixtures.push_back(patched(0, 'X'));   // magic
    fixtures.push_back(patched(4, 99));    // version
    fixtures.push_back(patched(5, 7));     // status
    {
        std::vector<u8> v = good;          // zero port
        v[6] = 0;
        v[7] = 0;
        fixtures.push_back(v);
    }
    {
        std::vector<u8> v = good;          // zero name length
        v[8] = 0;
        v[9] = 0;
        fixtures.push_back(std::vector<u8>(v.begin(), v.begin() + sizeof(PresenceHdr)));
    }
    fixtures.push_back(patched(9, 200));   // name longer than allowed
    {
        std::vector<u8> v = good;          // trailing byte
        v.push_back(0);
        fixtures.push_back(v);
    }

    for (size_t i = 0; i < fixtures.size(); ++i) {
        SCOPED_TRACE("fixture " + std::to_string(i));
        EXPECT_THROW(proto::decode_presence(fixtures[i]), MalformedDatagram);
    }
}

// ---------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------

static FileDescriptor file(const std::string& path, u64 size, u8 seed) {
    FileDescriptor f;
    f.rel_path = path;
    f.size     = size;
    for (int i = 0; i < 16; ++i) f.checksum[i] = (u8)(seed + i);
    return f;
}

static FileDescriptor dir(const std::string& path) {
    FileDescriptor f;
    f.rel_path     = path;
    f.is_directory = true;
    return f;
}

static TransferManifest manifest_with(std::vector<FileDescriptor> files) {
    TransferManifest m;
    m.files                  = std::move(files);
    m.parallelism            = 4;
    m.multi_stream_threshold = 1000;
    m.min_chunk_size         = 100;
    m.sender_name            = "sender box";
    m.select_mode();
    return m;
}

TEST(EnvelopeCodecTest, RoundTripZeroOneAndManyFiles) {
    std::vector<TransferManifest> cases;
    cases.push_back(manifest_with({}));
    cases.push_back(manifest_with({file("report.pdf", 123, 1)}));
    cases.push_back(manifest_with({dir("photos"), file("photos/a.jpg", 999, 2),
                                   file("photos/b.jpg", 5000, 3), dir("photos/empty"),
                                   file("photos/empty.txt", 0, 4), file("notes.txt", 17, 5)}));

    for (const auto& m : cases) {
        std::vector<u8> body = proto::encode_envelope(m);
        EXPECT_EQ(proto::decode_envelope(body.data(), body.size()), m);
    }
    EXPECT_EQ(cases[2].mode, TransferMode::MULTI_STREAM);
}

TEST(EnvelopeCodecTest, EncodeRejectsTraversalPaths) {
    for (const char* bad : {"../etc/passwd", "/etc/passwd", "a/../../b", "C:/x", "./a", "a//b"}) {
        SCOPED_TRACE(bad);
        EXPECT_THROW(proto::encode_envelope(manifest_with({file(bad, 1, 0)})), ProtocolViolation);
    }
}

TEST(EnvelopeCodecTest, EncodeRejectsEntriesSharingAnOutput) {
    EXPECT_THROW(proto::encode_envelope(manifest_with({file("a", 100000, 1), file("a", 10, 2)})),
                 ProtocolViolation);
    EXPECT_THROW(proto::encode_envelope(manifest_with({file("a", 10, 1), dir("a")})),
                 ProtocolViolation);
    EXPECT_THROW(proto::encode_envelope(manifest_with({file("d/x", 1, 1), file("d\\x", 1, 2)})),
                 ProtocolViolation);
    EXPECT_THROW(proto::encode_envelope(manifest_with({file("a", 10, 1), file("a/b", 1, 2)})),
                 ProtocolViolation);
    EXPECT_NO_THROW(proto::encode_envelope(manifest_with({dir("a"), file("a/b", 1, 2)})));
}

class EnvelopeDecodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        good_ = proto::encode_envelope(manifest_with({file("ab/cd", 10, 1), file("x.bin", 20, 2)}));
    }
    void expect_rejected(const std::vector<u8>& bytes) {
        EXPECT_THROW(proto::decode_envelope(bytes.data(), bytes.size()), ProtocolViolation);
    }
    std::vector<u8> good_;
};

TEST_F(EnvelopeDecodeTest, DecodesUnmodifiedBody) {
    TransferManifest m = proto::decode_envelope(good_.data(), good_.size());
    EXPECT_EQ(m.files.size(), 2u);
    EXPECT_EQ(m.total_bytes(), 30u);
}

TEST_F(EnvelopeDecodeTest, RejectsTraversalInjectedOnTheWire) {
    std::vector<u8> v = good_;
    auto it = std::search(v.begin(), v.end(), "ab/cd", "ab/cd" + 5);
    ASSERT_NE(it, v.end());
    std::memcpy(&*it, "../cd", 5);
    expect_rejected(v);
}

TEST_F(EnvelopeDecodeTest, RejectsDuplicatePathInjectedOnTheWire) {
    std::vector<u8> v = proto::encode_envelope(manifest_with({file("ab/cd", 10, 1), file("ab/ce", 20, 2)}));
    auto it = std::search(v.begin(), v.end(), "ab/ce", "ab/ce" + 5);
    ASSERT_NE(it, v.end());
    std::memcpy(&*it, "ab/cd", 5);
    expect_rejected(v);
}

TEST_F(EnvelopeDecodeTest, RejectsTrailingBytes) {
    std::vector<u8> v = good_;
    v.push_back(0);
    expect_rejected(v);
}

TEST_F(EnvelopeDecodeTest, RejectsTruncation) {
    expect_rejected(std::vector<u8>(good_.begin(), good_.end() - 1));
    expect_rejected(std::vector<u8>(good_.begin(), good_.begin() + 20));
}

TEST_F(EnvelopeDecodeTest, RejectsBadHeaderFields) {
    std::vector<u8> v = good_;
    v[0] = 'X';                         // magic
    expect_rejected(v);

    v = good_;
    v[4] = 42;                          // version
    expect_rejected(v);

    v = good_;
    v[5] = 1;                           // multi-stream with nothing above the threshold
    expect_rejected(v);

    v = good_;
    v[6] = 0;                           // parallelism 0
    v[7] = 0;
    expect_rejected(v);

    v = good_;
    v[23] ^= 0x01;                      // total_bytes disagrees with the records
    expect_rejected(v);
}

TEST(EnvelopeCodecTest, RejectsDirectoryWithSize) {
    TransferManifest m = manifest_with({dir("d")});
    std::vector<u8> v = proto::encode_envelope(m);
    // FileRecord follows header and sender name; file_size is its first field
    size_t rec = sizeof(EnvelopeHdr) + m.sender_name.size();
    v[rec + 7] = 5;
    v[23] = 5;                          // keep total_bytes consistent
    EXPECT_THROW(proto::decode_envelope(v.data(), v.size()), ProtocolViolation);
}

TEST(EnvelopeCodecTest, LargeEnvelopeTravelsCompressed) {
    std::vector<FileDescriptor> files;
    for (int i = 0; i < 3000; ++i) {
        files.push_back(file("library/volume_" + std::to_string(i) + "/chapter.txt", (u64)(i % 500), (u8)i));
    }
    TransferManifest m = manifest_with(files);
    ASSERT_GT(proto::encode_envelope(m).size(), (size_t)ENVELOPE_COMPRESS_THRESHOLD);

    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0);
    u16 port = listener.local_port();

    std::thread writer([&]() {
        TcpSocket out;
        out.set_idle_timeout_ms(5000);
        out.connect("127.0.0.1", port);
        proto::write_handshake(out, m);
        // Hold the connection until the reader has the frame
        FrameHeader hdr;
        std::vector<u8> payload;
        try {
            out.read_frame(hdr, payload);
        } catch (const TransferError&) {
        }
    });

    TcpSocket in = listener.accept(5000);
    ASSERT_TRUE(in.is_valid());
    in.set_idle_timeout_ms(5000);
    TransferManifest got = proto::read_handshake(in);
    in.close();
    writer.join();
    EXPECT_EQ(got, m);
}
