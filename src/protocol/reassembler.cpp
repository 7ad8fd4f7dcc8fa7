#include "peerdrop/protocol/reassembler.hpp"
#include <boost/log/trivial.hpp>

namespace peerdrop::protocol {

FileTransfer Reassembler::report(const InboundMeta& meta, int progress, TransferStatus status) const {
  FileTransfer transfer;
  transfer.id = meta.id;
  transfer.name = meta.name;
  transfer.size = meta.size;
  transfer.mime_type = meta.mime_type;
  transfer.progress = progress;
  transfer.status = status;
  transfer.direction = TransferDirection::INBOUND;
  return transfer;
}

//==============================================
// LIFECYCLE
//==============================================

FileTransfer Reassembler::begin(const InboundMeta& meta) {
  if (metadata_.count(meta.id) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Reassembler: Restarting transfer " << meta.id;
  }
  metadata_[meta.id] = meta;
  chunks_[meta.id] = Accumulation{};

  BOOST_LOG_TRIVIAL(debug) << "Reassembler: Expecting " << meta.size << " bytes for " << meta.id;
  return report(meta, 0, TransferStatus::TRANSFERRING);
}

std::optional<FileTransfer> Reassembler::complete(const std::string& id) {
  auto meta_it = metadata_.find(id);
  auto chunks_it = chunks_.find(id);
  if (meta_it == metadata_.end() || chunks_it == chunks_.end()) {
    return std::nullopt;
  }

  const InboundMeta meta = std::move(meta_it->second);
  Accumulation acc = std::move(chunks_it->second);
  metadata_.erase(meta_it);
  chunks_.erase(chunks_it);

  if (acc.dropped_chunks > 0 || acc.oversized_chunks > 0 || acc.bytes_received != meta.size) {
    FileTransfer failed = report(meta, compute_progress(acc.bytes_received, meta.size), TransferStatus::ERROR);
    if (acc.oversized_chunks > 0) {
      failed.error = "data beyond the declared " + std::to_string(meta.size) + " bytes";
    } else if (acc.dropped_chunks > 0) {
      failed.error = std::to_string(acc.dropped_chunks) + " chunk(s) failed authentication";
    } else {
      failed.error = "received " + std::to_string(acc.bytes_received) + " of " + std::to_string(meta.size) + " bytes";
    }
    BOOST_LOG_TRIVIAL(warning) << "Reassembler: Transfer " << id << " incomplete: " << failed.error;
    return failed;
  }

  std::vector<uint8_t> payload;
  payload.reserve(static_cast<std::size_t>(acc.bytes_received));
  for (const auto& chunk : acc.chunks) {
    payload.insert(payload.end(), chunk.begin(), chunk.end());
  }

  FileTransfer done = report(meta, 100, TransferStatus::COMPLETED);
  done.payload = std::move(payload);
  BOOST_LOG_TRIVIAL(info) << "Reassembler: Completed " << id << " (" << meta.size << " bytes in "
                          << acc.chunks.size() << " chunks)";
  return done;
}

void Reassembler::clear() {
  chunks_.clear();
  metadata_.clear();
}

//==============================================
// CHUNKS
//==============================================

std::optional<FileTransfer> Reassembler::append(const std::string& id, std::vector<uint8_t> chunk) {
  auto meta_it = metadata_.find(id);
  auto chunks_it = chunks_.find(id);
  if (meta_it == metadata_.end() || chunks_it == chunks_.end()) {
    return std::nullopt;
  }

  Accumulation& acc = chunks_it->second;
  if (acc.bytes_received + chunk.size() > meta_it->second.size) {
    ++acc.oversized_chunks;
    BOOST_LOG_TRIVIAL(warning) << "Reassembler: Dropped " << chunk.size() << " bytes for " << id
                               << " beyond the declared " << meta_it->second.size;
    return std::nullopt;
  }
  acc.bytes_received += chunk.size();
  acc.chunks.push_back(std::move(chunk));

  return report(meta_it->second, compute_progress(acc.bytes_received, meta_it->second.size),
                TransferStatus::TRANSFERRING);
}

bool Reassembler::mark_corrupted(const std::string& id) {
  auto it = chunks_.find(id);
  if (it == chunks_.end()) {
    return false;
  }
  ++it->second.dropped_chunks;
  return true;
}

//==============================================
// QUERIES
//==============================================

bool Reassembler::contains(const std::string& id) const {
  return metadata_.count(id) != 0;
}

} // namespace peerdrop::protocol
