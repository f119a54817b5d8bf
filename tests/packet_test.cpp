#include <gtest/gtest.h>
#include <pbrpc/errors.hpp>
#include <pbrpc/packet.hpp>
#include <pbrpc/packet_builder.hpp>
#include <cstring>

using namespace pbrpc;

namespace {
    int32_t ReadInt32At(const Bytes& bytes, size_t offset) {
        return static_cast<int32_t>(
            (static_cast<uint32_t>(bytes[offset]) << 24) |
            (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
            (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
            static_cast<uint32_t>(bytes[offset + 3]));
    }

    void WriteInt32At(Bytes& bytes, size_t offset, int32_t value) {
        uint32_t uvalue = static_cast<uint32_t>(value);
        bytes[offset] = static_cast<uint8_t>(uvalue >> 24);
        bytes[offset + 1] = static_cast<uint8_t>(uvalue >> 16);
        bytes[offset + 2] = static_cast<uint8_t>(uvalue >> 8);
        bytes[offset + 3] = static_cast<uint8_t>(uvalue);
    }
}

class PacketTest : public ::testing::Test {
protected:
    static Packet MakeRequest() {
        return PacketBuilder()
            .MagicCode("PRPC")
            .ServiceName("EchoService")
            .MethodName("echo")
            .LogId(42)
            .Trace(Trace{1, "key", 2, 3})
            .ExtField("k", "v")
            .CompressType(CompressType::SNAPPY)
            .CorrelationId(77)
            .AuthenticationData(Bytes{0xAA})
            .Data(Bytes{0x01, 0x02, 0x03, 0x04, 0x05})
            .Attachment(Bytes{0xA1, 0xA2, 0xA3})
            .Build();
    }
};

TEST_F(PacketTest, RoundTrip) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    Packet decoded = Packet::Decode(encoded);

    ASSERT_TRUE(decoded.GetHead().has_value());
    ASSERT_TRUE(decoded.GetMeta().has_value());
    EXPECT_EQ(decoded.GetHead()->GetTotalSize(), packet.GetHead()->GetTotalSize());
    EXPECT_EQ(decoded.GetHead()->GetMetaSize(), packet.GetHead()->GetMetaSize());
    EXPECT_EQ(*decoded.GetMeta(), *packet.GetMeta());
    EXPECT_EQ(decoded.GetData(), packet.GetData());
    EXPECT_EQ(decoded.GetAttachment(), packet.GetAttachment());
    EXPECT_EQ(decoded.GetServiceName(), "EchoService");
    EXPECT_EQ(decoded.GetMethodName(), "echo");
    EXPECT_EQ(decoded.GetLogId(), 42);
    EXPECT_EQ(decoded.GetCorrelationId(), 77);
    EXPECT_GT(decoded.GetTimestamp(), 0);
}

TEST_F(PacketTest, HeadBytesMatchSizes) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    ASSERT_GE(encoded.size(), protocol::HEAD_SIZE);
    EXPECT_EQ(std::memcmp(encoded.data(), "PRPC", 4), 0);
    EXPECT_EQ(ReadInt32At(encoded, 4), packet.GetHead()->GetTotalSize());
    EXPECT_EQ(ReadInt32At(encoded, 8), packet.GetHead()->GetMetaSize());
    EXPECT_EQ(encoded.size(), protocol::HEAD_SIZE + static_cast<size_t>(packet.GetHead()->GetTotalSize()));
}

TEST_F(PacketTest, CustomMagicIsWritten) {
    Packet packet = PacketBuilder().MagicCode("HULU").ServiceName("s").MethodName("m").Build();
    Bytes encoded = packet.Encode();
    EXPECT_EQ(std::memcmp(encoded.data(), "HULU", 4), 0);

    Packet decoded = Packet::Decode(encoded);
    EXPECT_FALSE(decoded.GetHead()->HasValidMagic());
}

TEST_F(PacketTest, EncodeUpdatesSizeFields) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    const RpcMeta& meta = *packet.GetMeta();
    const Head& head = *packet.GetHead();
    Bytes meta_bytes = meta.Encode();

    EXPECT_EQ(meta.attachment_size, 3);
    EXPECT_EQ(head.GetMetaSize(), static_cast<int32_t>(meta_bytes.size()));
    EXPECT_EQ(head.GetTotalSize(), static_cast<int32_t>(5 + 3 + meta_bytes.size()));
}

TEST_F(PacketTest, EncodeIsReproducible) {
    Packet packet = MakeRequest();
    Bytes first = packet.Encode();
    Bytes second = packet.Encode();
    EXPECT_EQ(first, second);
}

TEST_F(PacketTest, EncodeWithoutAttachmentResetsAttachmentSize) {
    RpcMeta meta;
    meta.attachment_size = 99;
    Packet packet(Head(), meta, Bytes{0x01});

    Bytes encoded = packet.Encode();
    EXPECT_EQ(packet.GetMeta()->attachment_size, 0);

    Packet decoded = Packet::Decode(encoded);
    EXPECT_EQ(decoded.GetData(), Bytes{0x01});
    EXPECT_TRUE(decoded.GetAttachment().empty());
}

TEST_F(PacketTest, EncodeWithoutHeadThrows) {
    Packet packet(std::nullopt, RpcMeta{});
    EXPECT_THROW(packet.Encode(), StateError);
}

TEST_F(PacketTest, EncodeWithoutMetaThrows) {
    Packet packet(Head(), std::nullopt);
    EXPECT_THROW(packet.Encode(), StateError);

    Packet empty;
    EXPECT_THROW(empty.Encode(), StateError);
}

TEST_F(PacketTest, EmptyDataIsValid) {
    Packet packet = PacketBuilder()
        .MagicCode("PRPC")
        .ErrorCode(0)
        .CorrelationId(5)
        .Build();
    Bytes encoded = packet.Encode();

    Packet decoded = Packet::Decode(encoded);
    EXPECT_TRUE(decoded.GetData().empty());
    EXPECT_TRUE(decoded.GetAttachment().empty());
    ASSERT_TRUE(decoded.GetMeta()->response.has_value());
    EXPECT_EQ(decoded.GetCorrelationId(), 5);
}

TEST_F(PacketTest, DecodeNullThrows) {
    EXPECT_THROW(Packet::Decode(nullptr, 0), ArgumentError);
}

TEST_F(PacketTest, DecodeShortHeadThrows) {
    Bytes bytes = {'P', 'R', 'P', 'C', 0x00};
    EXPECT_THROW(Packet::Decode(bytes), FormatError);
    EXPECT_THROW(Packet::Decode(Bytes{}), FormatError);
}

TEST_F(PacketTest, DecodeTruncatedMetaThrows) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    Bytes truncated(encoded.begin(), encoded.begin() + protocol::HEAD_SIZE + 2);
    EXPECT_THROW(Packet::Decode(truncated), FormatError);
}

TEST_F(PacketTest, DecodeTruncatedPayloadThrows) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    // Missing the last attachment byte
    Bytes truncated(encoded.begin(), encoded.end() - 1);
    EXPECT_THROW(Packet::Decode(truncated), FormatError);

    // Missing the attachment and part of the data
    size_t meta_end = protocol::HEAD_SIZE + static_cast<size_t>(packet.GetHead()->GetMetaSize());
    Bytes no_payload(encoded.begin(), encoded.begin() + meta_end + 2);
    EXPECT_THROW(Packet::Decode(no_payload), FormatError);
}

TEST_F(PacketTest, DecodeNegativeDataSizeThrows) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    // TotalSize smaller than MetaSize + AttachmentSize
    WriteInt32At(encoded, 4, packet.GetHead()->GetMetaSize());
    EXPECT_THROW(Packet::Decode(encoded), FormatError);
}

TEST_F(PacketTest, DecodeNegativeMetaSizeThrows) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();

    WriteInt32At(encoded, 8, -1);
    EXPECT_THROW(Packet::Decode(encoded), FormatError);
}

TEST_F(PacketTest, DecodeIgnoresBytesPastTotalSize) {
    Packet packet = MakeRequest();
    Bytes encoded = packet.Encode();
    encoded.push_back(0x99);

    Packet decoded = Packet::Decode(encoded);
    EXPECT_EQ(decoded.GetAttachment(), (Bytes{0xA1, 0xA2, 0xA3}));
}

TEST_F(PacketTest, CloneIsIndependent) {
    Packet original = MakeRequest();
    Packet copy = original.Clone();

    copy.MergeData(Bytes{0x06});
    copy.SetCorrelationId(1000);

    EXPECT_EQ(original.GetData().size(), 5u);
    EXPECT_EQ(copy.GetData().size(), 6u);
    EXPECT_EQ(original.GetCorrelationId(), 77);
    EXPECT_EQ(copy.GetCorrelationId(), 1000);
    EXPECT_NE(original.GetData().data(), copy.GetData().data());
    EXPECT_NE(original.GetAttachment().data(), copy.GetAttachment().data());
}

TEST_F(PacketTest, ErrorResponseReplacesRequest) {
    Packet request = MakeRequest();
    Packet response = request.ErrorResponse(5001, "boom");

    ASSERT_TRUE(response.GetMeta().has_value());
    const RpcMeta& meta = *response.GetMeta();
    EXPECT_FALSE(meta.request.has_value());
    ASSERT_TRUE(meta.response.has_value());
    EXPECT_EQ(meta.response->error_code, 5001);
    EXPECT_EQ(meta.response->error_text, "boom");
    EXPECT_EQ(meta.correlation_id, 77);
    EXPECT_TRUE(response.GetData().empty());
    EXPECT_TRUE(response.GetAttachment().empty());

    // The request is untouched
    EXPECT_TRUE(request.GetMeta()->request.has_value());

    Packet decoded = Packet::Decode(response.Encode());
    EXPECT_EQ(decoded.GetMeta()->response->error_text, "boom");
}

TEST_F(PacketTest, BuilderIsReusable) {
    PacketBuilder builder;
    builder.MagicCode("PRPC").ServiceName("s").MethodName("m").Data(Bytes{0x01});

    Packet first = builder.Build();
    Packet second = builder.Data(Bytes{0x02}).Build();

    EXPECT_EQ(first.GetData(), Bytes{0x01});
    EXPECT_EQ(second.GetData(), Bytes{0x02});
}

TEST_F(PacketTest, BuilderWithoutMagicHasNoHead) {
    Packet packet = PacketBuilder().ServiceName("s").MethodName("m").Build();
    EXPECT_FALSE(packet.GetHead().has_value());
    EXPECT_THROW(packet.Encode(), StateError);
}

TEST_F(PacketTest, EncodeForTransmissionSplitsByConfig) {
    Packet packet = MakeRequest();

    ProtocolConfig config;
    EXPECT_EQ(EncodeForTransmission(packet, config).size(), 1u);

    config.chunk_size = 2;
    std::vector<Bytes> frames = EncodeForTransmission(packet, config);
    ASSERT_EQ(frames.size(), 3u);

    Packet last = Packet::Decode(frames.back());
    EXPECT_TRUE(last.IsFinalPackage());
    EXPECT_EQ(last.GetData(), Bytes{0x05});
}
