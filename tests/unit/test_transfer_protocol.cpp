#include <catch2/catch_test_macros.hpp>
#include "peerdrop/transfer/protocol.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <string>
#include <vector>
using namespace peerdrop;
using namespace peerdrop::transfer;
namespace {
std::vector<uint8_t> ControlFrame(const std::string& json) {
    std::vector<uint8_t> frame{kFrameControl};
    frame.insert(frame.end(), json.begin(), json.end());
    return frame;
}
ControlMessage ParseControl(std::span<const uint8_t> frame) {
    auto parsed = ParseFrame(frame);
    REQUIRE(parsed.IsOk());
    REQUIRE(std::holds_alternative<ControlMessage>(parsed.Unwrap()));
    return std::get<ControlMessage>(parsed.Unwrap());
}
}
TEST_CASE("TransferProtocol - Chunk arithmetic", "[transfer][protocol]") {
    REQUIRE(TotalChunks(0) == 0);
    REQUIRE(TotalChunks(1) == 1);
    REQUIRE(TotalChunks(16384) == 1);
    REQUIRE(TotalChunks(16385) == 2);
    REQUIRE(TotalChunks(50000) == 4);
    REQUIRE(TotalChunks(std::numeric_limits<uint64_t>::max()) == (uint64_t{1} << 50));
    const auto info = FileInfo::Describe("report.pdf", 50000);
    REQUIRE(info.chunk_size == 16384);
    REQUIRE(info.total_chunks == 4);
}
TEST_CASE("TransferProtocol - Control messages", "[transfer][protocol]") {
    SECTION("Every control message survives encoding") {
        const std::vector<ControlMessage> messages = {
            FileInfo::Describe("a.bin", 20000),
            EncryptedFileInfo{{1, 2, 3}, {4, 5}},
            Ready{},
            ChunkHeader{7},
            Ack{3},
            Done{},
            TransferError{"disk full"},
        };
        for (const auto& message : messages) {
            const auto frame = EncodeControl(message);
            REQUIRE(frame.front() == kFrameControl);
            REQUIRE(ParseControl(frame) == message);
        }
    }
    SECTION("Wire field names") {
        const auto frame = EncodeControl(EncryptedFileInfo{{9}, {8, 7}});
        const auto j = nlohmann::json::parse(frame.begin() + 1, frame.end());
        REQUIRE(j.at("type") == "encrypted_file_info");
        REQUIRE(j.at("nonce") == nlohmann::json::array({9}));
        REQUIRE(j.at("ciphertext") == nlohmann::json::array({8, 7}));
    }
    SECTION("Frames from a peer implementation") {
        REQUIRE(ParseControl(ControlFrame(R"({"type":"ack","index":12})")) == ControlMessage{Ack{12}});
        REQUIRE(ParseControl(ControlFrame(R"({"type":"ready"})")) == ControlMessage{Ready{}});
        const auto info = std::get<FileInfo>(ParseControl(ControlFrame(
            R"({"type":"file_info","filename":"x.txt","size":5,"chunk_size":16384,"total_chunks":1})")));
        REQUIRE(info.filename == "x.txt");
        REQUIRE(info.size == 5);
    }
    SECTION("Malformed control frames are decode errors") {
        for (const std::string body : {"", "not json", "[1,2]", R"({"type":"warp"})", R"({"type":"ack"})"}) {
            auto parsed = ParseFrame(ControlFrame(body));
            REQUIRE(parsed.IsErr());
            REQUIRE(parsed.UnwrapErr().type == PeerDropFailureType::Decode);
        }
    }
}
TEST_CASE("TransferProtocol - Chunk frames", "[transfer][protocol]") {
    SECTION("Encrypted chunk layout") {
        EncryptedChunkFrame chunk;
        chunk.index = 0x0102;
        chunk.nonce.fill(0xCC);
        chunk.ciphertext.assign(kAesGcmTagBytes + 3, 0xEE);
        const auto frame = EncodeEncryptedChunk(chunk);
        REQUIRE(frame.size() == kMinEncryptedChunkFrameBytes + 3);
        REQUIRE(frame[0] == kFrameEncryptedChunk);
        REQUIRE(frame[7] == 0x01);
        REQUIRE(frame[8] == 0x02);
        REQUIRE(frame[9] == 0xCC);
        auto parsed = ParseFrame(frame);
        REQUIRE(parsed.IsOk());
        const auto& decoded = std::get<EncryptedChunkFrame>(parsed.Unwrap());
        REQUIRE(decoded.index == chunk.index);
        REQUIRE(decoded.nonce == chunk.nonce);
        REQUIRE(decoded.ciphertext == chunk.ciphertext);
    }
    SECTION("Encrypted chunk shorter than 37 bytes is rejected") {
        std::vector<uint8_t> frame(kMinEncryptedChunkFrameBytes - 1, 0);
        frame[0] = kFrameEncryptedChunk;
        REQUIRE(ParseFrame(frame).IsErr());
        frame.push_back(0);
        REQUIRE(ParseFrame(frame).IsOk());
    }
    SECTION("Legacy chunk") {
        const auto frame = EncodeLegacyChunk(LegacyChunk{5, {1, 2, 3}});
        REQUIRE(frame.size() == kMinLegacyChunkFrameBytes + 3);
        auto parsed = ParseFrame(frame);
        REQUIRE(parsed.IsOk());
        const auto& decoded = std::get<LegacyChunk>(parsed.Unwrap());
        REQUIRE(decoded.index == 5);
        REQUIRE(decoded.data == std::vector<uint8_t>{1, 2, 3});
        std::vector<uint8_t> short_frame(kMinLegacyChunkFrameBytes - 1, 0);
        short_frame[0] = kFrameLegacyChunk;
        REQUIRE(ParseFrame(short_frame).IsErr());
    }
    SECTION("Empty and unknown frames") {
        REQUIRE(ParseFrame(std::vector<uint8_t>{}).IsErr());
        REQUIRE(ParseFrame(std::vector<uint8_t>{7, 0, 0}).IsErr());
    }
}
TEST_CASE("TransferProtocol - File info serialization", "[transfer][protocol]") {
    const auto info = FileInfo::Describe("notes.md", 123);
    auto parsed = ParseFileInfo(SerializeFileInfo(info));
    REQUIRE(parsed.IsOk());
    REQUIRE(parsed.Unwrap() == info);
    const std::string bad = R"({"filename":"x"})";
    REQUIRE(ParseFileInfo(std::vector<uint8_t>(bad.begin(), bad.end())).IsErr());
}
