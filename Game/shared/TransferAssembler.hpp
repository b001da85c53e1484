#pragma once

#include "NetworkTypes.hpp"
#include "NetworkProtocol.hpp"
#include <cstdint>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace Spraynet {

enum class TransferStatus : uint8_t
{
    Started,                // begin accepted, waiting for chunks
    Appended,               // chunk stored, more expected
    Completed,              // payload delivered, pending entry removed
    RejectedTooLarge,       // begin announced more than the ceiling
    RejectedAlreadyPending, // begin while a transfer from that sender is still open
    InitialPacketLost,      // chunk without a pending transfer
    Malformed               // chunk larger than the chunk budget or the remaining bytes
};

const char* transferStatusName(TransferStatus status);

// Rebuilds one payload per sender from a length announcement followed by
// in-order chunks of at most TRANSFER_CHUNK_PAYLOAD bytes.
//
// Not thread-safe: all receive processing must happen on the simulation
// thread. Chunks are assumed to arrive in send order (ordered channel).
class TransferAssembler
{
public:
    TransferAssembler(uint32_t max_total_length = MAX_ASSET_SIZE, double timeout_seconds = 10.0);

    // A zero-length transfer completes immediately and 'completed' receives an empty payload.
    TransferStatus begin(NetworkIdentity sender, uint32_t total_length, double now, std::vector<uint8_t>& completed);

    // On Completed, 'completed' receives the whole payload and the pending entry is already gone.
    // A Malformed chunk drops the pending transfer for that sender.
    TransferStatus append(NetworkIdentity sender, const uint8_t* data, size_t size, std::vector<uint8_t>& completed);

    bool cancel(NetworkIdentity sender);
    void cancelAll();

    // Removes transfers whose deadline has passed and returns their senders
    std::vector<NetworkIdentity> expire(double now);

    bool isPending(NetworkIdentity sender) const;
    size_t pendingCount() const { return pending.size(); }
    uint32_t bytesReceived(NetworkIdentity sender) const;
    uint32_t expectedLength(NetworkIdentity sender) const;

    uint32_t getMaxTotalLength() const { return max_total_length; }
    void setTimeout(double seconds) { timeout_seconds = seconds; }
    double getTimeout() const { return timeout_seconds; }

private:
    struct PendingTransfer
    {
        uint32_t total_length = 0;
        uint32_t write_offset = 0;
        std::vector<uint8_t> buffer;
        double deadline = 0.0;
    };

    std::unordered_map<NetworkIdentity, PendingTransfer> pending;
    uint32_t max_total_length;
    double timeout_seconds;
};

} // namespace Spraynet
