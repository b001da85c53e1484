#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "TransferAssembler.hpp"

#include <algorithm>

namespace Spraynet {

namespace {

constexpr NetworkIdentity ALICE = 0xA11CE;
constexpr NetworkIdentity BOB = 0xB0B;

std::vector<uint8_t> makePayload(size_t size)
{
    std::vector<uint8_t> payload(size);
    for (size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return payload;
}

// Feeds the payload in protocol-sized chunks and returns the reassembled bytes
std::vector<uint8_t> pushThrough(TransferAssembler& assembler, NetworkIdentity sender, const std::vector<uint8_t>& payload)
{
    std::vector<uint8_t> completed;
    TransferStatus status = assembler.begin(sender, static_cast<uint32_t>(payload.size()), 0.0, completed);
    if (status == TransferStatus::Completed) {
        return completed;
    }
    REQUIRE(status == TransferStatus::Started);

    for (size_t offset = 0; offset < payload.size(); offset += TRANSFER_CHUNK_PAYLOAD) {
        size_t size = std::min(TRANSFER_CHUNK_PAYLOAD, payload.size() - offset);
        status = assembler.append(sender, payload.data() + offset, size, completed);
        bool last = offset + size == payload.size();
        REQUIRE(status == (last ? TransferStatus::Completed : TransferStatus::Appended));
    }
    return completed;
}

}

TEST_CASE("Payloads are rebuilt byte for byte", "[transfer]")
{
    const size_t size = GENERATE(size_t(0), size_t(1), TRANSFER_CHUNK_PAYLOAD, TRANSFER_CHUNK_PAYLOAD + 1,
                                 size_t(MAX_ASSET_SIZE));
    TransferAssembler assembler;
    std::vector<uint8_t> payload = makePayload(size);

    REQUIRE(pushThrough(assembler, ALICE, payload) == payload);
    REQUIRE_FALSE(assembler.isPending(ALICE));
    REQUIRE(assembler.pendingCount() == 0);
}

TEST_CASE("A chunk without a begin reports the lost initial packet", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;
    const uint8_t chunk[4] = {1, 2, 3, 4};

    REQUIRE(assembler.append(ALICE, chunk, sizeof(chunk), completed) == TransferStatus::InitialPacketLost);
    REQUIRE_FALSE(assembler.isPending(ALICE));
    REQUIRE(completed.empty());

    // A later, well-formed transfer still works
    std::vector<uint8_t> payload = makePayload(300);
    REQUIRE(pushThrough(assembler, ALICE, payload) == payload);
}

TEST_CASE("A second begin does not replace the pending transfer", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;
    std::vector<uint8_t> payload = makePayload(300);

    REQUIRE(assembler.begin(ALICE, 300, 0.0, completed) == TransferStatus::Started);
    REQUIRE(assembler.append(ALICE, payload.data(), 240, completed) == TransferStatus::Appended);

    REQUIRE(assembler.begin(ALICE, 50, 0.0, completed) == TransferStatus::RejectedAlreadyPending);
    REQUIRE(assembler.bytesReceived(ALICE) == 240);
    REQUIRE(assembler.expectedLength(ALICE) == 300);

    REQUIRE(assembler.append(ALICE, payload.data() + 240, 60, completed) == TransferStatus::Completed);
    REQUIRE(completed == payload);

    // Finished, so a new transfer may start
    REQUIRE(assembler.begin(ALICE, 50, 0.0, completed) == TransferStatus::Started);
}

TEST_CASE("Oversized announcements are rejected without state", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;

    REQUIRE(assembler.begin(ALICE, MAX_ASSET_SIZE + 1, 0.0, completed) == TransferStatus::RejectedTooLarge);
    REQUIRE_FALSE(assembler.isPending(ALICE));
}

TEST_CASE("Chunks that overflow the announced length drop the transfer", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;
    std::vector<uint8_t> payload = makePayload(TRANSFER_CHUNK_PAYLOAD + 1);

    SECTION("Larger than the remaining bytes")
    {
        REQUIRE(assembler.begin(ALICE, 10, 0.0, completed) == TransferStatus::Started);
        REQUIRE(assembler.append(ALICE, payload.data(), 11, completed) == TransferStatus::Malformed);
    }

    SECTION("Larger than the chunk budget")
    {
        REQUIRE(assembler.begin(ALICE, 1000, 0.0, completed) == TransferStatus::Started);
        REQUIRE(assembler.append(ALICE, payload.data(), payload.size(), completed) == TransferStatus::Malformed);
    }

    REQUIRE_FALSE(assembler.isPending(ALICE));
    REQUIRE(completed.empty());
}

TEST_CASE("Cancel only affects the named sender", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;

    REQUIRE(assembler.begin(ALICE, 100, 0.0, completed) == TransferStatus::Started);
    REQUIRE(assembler.begin(BOB, 100, 0.0, completed) == TransferStatus::Started);

    REQUIRE(assembler.cancel(ALICE));
    REQUIRE_FALSE(assembler.cancel(ALICE));
    REQUIRE_FALSE(assembler.isPending(ALICE));
    REQUIRE(assembler.isPending(BOB));

    const uint8_t chunk[1] = {0};
    REQUIRE(assembler.append(ALICE, chunk, 1, completed) == TransferStatus::InitialPacketLost);

    assembler.cancelAll();
    REQUIRE(assembler.pendingCount() == 0);
}

TEST_CASE("Stalled transfers expire after the deadline", "[transfer]")
{
    TransferAssembler assembler(MAX_ASSET_SIZE, 10.0);
    std::vector<uint8_t> completed;

    REQUIRE(assembler.begin(ALICE, 100, 0.0, completed) == TransferStatus::Started);
    REQUIRE(assembler.begin(BOB, 100, 5.0, completed) == TransferStatus::Started);

    REQUIRE(assembler.expire(9.9).empty());

    std::vector<NetworkIdentity> expired = assembler.expire(10.0);
    REQUIRE(expired == std::vector<NetworkIdentity>{ALICE});
    REQUIRE_FALSE(assembler.isPending(ALICE));
    REQUIRE(assembler.isPending(BOB));
}

TEST_CASE("Senders are reassembled independently", "[transfer]")
{
    TransferAssembler assembler;
    std::vector<uint8_t> completed;
    std::vector<uint8_t> a = makePayload(400);
    std::vector<uint8_t> b(250, 0x42);

    REQUIRE(assembler.begin(ALICE, 400, 0.0, completed) == TransferStatus::Started);
    REQUIRE(assembler.begin(BOB, 250, 0.0, completed) == TransferStatus::Started);

    REQUIRE(assembler.append(ALICE, a.data(), 240, completed) == TransferStatus::Appended);
    REQUIRE(assembler.append(BOB, b.data(), 240, completed) == TransferStatus::Appended);
    REQUIRE(assembler.append(BOB, b.data() + 240, 10, completed) == TransferStatus::Completed);
    REQUIRE(completed == b);
    REQUIRE(assembler.append(ALICE, a.data() + 240, 160, completed) == TransferStatus::Completed);
    REQUIRE(completed == a);
}

} // namespace Spraynet
