#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "internal/hash/hash_codec.hpp"

namespace photosift::grouping {

/*
  One compared pair, by canonical index (first < second).
*/
struct PairDistance {
  std::uint32_t                first   = 0;
  std::uint32_t                second  = 0;
  std::uint16_t                primary = 0;
  std::optional<std::uint16_t> secondary;

  bool operator==(const PairDistance&) const = default;
};

// Decides which compared pairs are kept. Receives primary and (when both
// sides carry one) secondary distance.
using PairFilter = std::function<bool(unsigned primary, std::optional<unsigned> secondary)>;

struct PairScanOptions {
  std::size_t workers    = 0; // 0 = hardware concurrency
  std::size_t block_rows = 256;
};

/*
  Upper-triangle pairwise comparison, partitioned into row blocks.

  Block b covers rows [b * block_rows, (b + 1) * block_rows) against every
  later column. Blocks are independent: workers share only read-only hash
  data and each writes its own output slot. Blocks are handed to the sink in
  ascending order, so the stored pair sequence is identical whatever the
  worker count.
*/
class PairScanner {
 public:
  using BlockSink = std::function<void(std::size_t block_index, std::vector<PairDistance> pairs)>;

  PairScanner(PairScanOptions options, PairFilter filter);

  std::size_t BlockCount(std::size_t candidate_count) const;

  // Scans blocks [first_block, BlockCount) and calls sink once per block, in
  // order, from the calling thread.
  void Scan(const std::vector<hash::HashPair>& hashes, std::size_t first_block, const BlockSink& sink) const;

 private:
  std::vector<PairDistance> ScanBlock(const std::vector<hash::HashPair>& hashes, std::size_t block_index) const;

  std::size_t WorkerCount() const;

  PairScanOptions options_;
  PairFilter      filter_;
};

} // namespace photosift::grouping
