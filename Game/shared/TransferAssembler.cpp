#include "TransferAssembler.hpp"
#include "Utils/Log.hpp"

#include <cstring>

namespace Spraynet {

const char* transferStatusName(TransferStatus status)
{
    switch (status) {
        case TransferStatus::Started:                return "Started";
        case TransferStatus::Appended:               return "Appended";
        case TransferStatus::Completed:              return "Completed";
        case TransferStatus::RejectedTooLarge:       return "RejectedTooLarge";
        case TransferStatus::RejectedAlreadyPending: return "RejectedAlreadyPending";
        case TransferStatus::InitialPacketLost:      return "InitialPacketLost";
        case TransferStatus::Malformed:              return "Malformed";
    }
    return "Unknown";
}

TransferAssembler::TransferAssembler(uint32_t max_length, double timeout)
    : max_total_length(max_length)
    , timeout_seconds(timeout)
{
}

TransferStatus TransferAssembler::begin(NetworkIdentity sender, uint32_t total_length, double now, std::vector<uint8_t>& completed)
{
    if (total_length > max_total_length) {
        LOG_NET_WARN("Transfer from {0} rejected: {1} bytes exceeds the {2} byte limit", sender, total_length, max_total_length);
        return TransferStatus::RejectedTooLarge;
    }

    if (pending.count(sender) != 0) {
        LOG_NET_WARN("Transfer from {0} rejected: a transfer is already pending", sender);
        return TransferStatus::RejectedAlreadyPending;
    }

    if (total_length == 0) {
        LOG_NET_DEBUG("Empty transfer from {0} completed on begin", sender);
        completed.clear();
        return TransferStatus::Completed;
    }

    // Allocate before touching the table so a failed allocation leaves it unchanged
    PendingTransfer transfer;
    transfer.total_length = total_length;
    transfer.buffer.resize(total_length);
    transfer.deadline = now + timeout_seconds;

    pending.emplace(sender, std::move(transfer));
    LOG_NET_DEBUG("Transfer from {0} started ({1} bytes)", sender, total_length);
    return TransferStatus::Started;
}

TransferStatus TransferAssembler::append(NetworkIdentity sender, const uint8_t* data, size_t size, std::vector<uint8_t>& completed)
{
    auto it = pending.find(sender);
    if (it == pending.end()) {
        LOG_NET_ERROR("Chunk from {0} has no pending transfer, the initial packet was lost", sender);
        return TransferStatus::InitialPacketLost;
    }

    PendingTransfer& transfer = it->second;
    const uint32_t remaining = transfer.total_length - transfer.write_offset;

    if (size > TRANSFER_CHUNK_PAYLOAD || size > remaining || (size > 0 && data == nullptr)) {
        LOG_NET_ERROR("Malformed chunk from {0}: {1} bytes with {2} remaining, dropping transfer", sender, size, remaining);
        pending.erase(it);
        return TransferStatus::Malformed;
    }

    if (size > 0) {
        std::memcpy(transfer.buffer.data() + transfer.write_offset, data, size);
        transfer.write_offset += static_cast<uint32_t>(size);
    }

    if (transfer.write_offset < transfer.total_length) {
        return TransferStatus::Appended;
    }

    LOG_NET_DEBUG("Transfer from {0} finished ({1} bytes)", sender, transfer.total_length);
    completed = std::move(transfer.buffer);
    pending.erase(it);
    return TransferStatus::Completed;
}

bool TransferAssembler::cancel(NetworkIdentity sender)
{
    if (pending.erase(sender) == 0) {
        return false;
    }
    LOG_NET_DEBUG("Transfer from {0} cancelled", sender);
    return true;
}

void TransferAssembler::cancelAll()
{
    if (!pending.empty()) {
        LOG_NET_DEBUG("Cancelling {0} pending transfers", pending.size());
    }
    pending.clear();
}

std::vector<NetworkIdentity> TransferAssembler::expire(double now)
{
    std::vector<NetworkIdentity> expired;
    for (auto it = pending.begin(); it != pending.end();) {
        if (now >= it->second.deadline) {
            LOG_NET_WARN("Transfer from {0} timed out at {1}/{2} bytes", it->first,
                it->second.write_offset, it->second.total_length);
            expired.push_back(it->first);
            it = pending.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

bool TransferAssembler::isPending(NetworkIdentity sender) const
{
    return pending.count(sender) != 0;
}

uint32_t TransferAssembler::bytesReceived(NetworkIdentity sender) const
{
    auto it = pending.find(sender);
    return it != pending.end() ? it->second.write_offset : 0;
}

uint32_t TransferAssembler::expectedLength(NetworkIdentity sender) const
{
    auto it = pending.find(sender);
    return it != pending.end() ? it->second.total_length : 0;
}

} // namespace Spraynet
