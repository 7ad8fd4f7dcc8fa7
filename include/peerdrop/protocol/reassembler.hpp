#ifndef PEERDROP_PROTOCOL_REASSEMBLER_HPP
#define PEERDROP_PROTOCOL_REASSEMBLER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "peerdrop/protocol/file_transfer.hpp"

namespace peerdrop::protocol {

// Plaintext metadata of an inbound file
struct InboundMeta {
    std::string id;
    std::string name;
    uint64_t size{0};
    std::string mime_type;
};

/**
 * Accumulates inbound chunks per transfer id. Chunk and metadata entries
 * are created together by begin() and removed together by complete();
 * chunks for ids without an entry are ignored.
 */
class Reassembler {
public:
    // ---- LIFECYCLE ----
    // Returns the initial report (transferring, 0%)
    FileTransfer begin(const InboundMeta& meta);
    // nullopt when the id is unknown
    std::optional<FileTransfer> complete(const std::string& id);
    void clear();

    // ---- CHUNKS ----
    // Returns a progress report. nullopt when the id is unknown or the chunk
    // would exceed the declared size; such a chunk is dropped and fails the transfer.
    std::optional<FileTransfer> append(const std::string& id, std::vector<uint8_t> chunk);
    // Records a chunk that could not be authenticated or decoded; false for unknown ids
    bool mark_corrupted(const std::string& id);

    // ---- QUERIES ----
    bool contains(const std::string& id) const;
    std::size_t size() const { return metadata_.size(); }

private:
    struct Accumulation {
        std::vector<std::vector<uint8_t>> chunks;
        uint64_t bytes_received{0};
        std::size_t dropped_chunks{0};
        std::size_t oversized_chunks{0};
    };

    FileTransfer report(const InboundMeta& meta, int progress, TransferStatus status) const;

    std::map<std::string, Accumulation> chunks_;
    std::map<std::string, InboundMeta> metadata_;
};

} // namespace peerdrop::protocol

#endif // PEERDROP_PROTOCOL_REASSEMBLER_HPP
