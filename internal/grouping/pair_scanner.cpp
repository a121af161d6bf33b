#include "pair_scanner.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

namespace photosift::grouping {

PairScanner::PairScanner(PairScanOptions options, PairFilter filter) : options_(options), filter_(std::move(filter)) {
  if (options_.block_rows == 0) {
    throw std::invalid_argument("pair scan block_rows must be > 0");
  }
  if (!filter_) {
    throw std::invalid_argument("pair scan needs a filter");
  }
}

std::size_t PairScanner::BlockCount(std::size_t candidate_count) const {
  return (candidate_count + options_.block_rows - 1) / options_.block_rows;
}

std::size_t PairScanner::WorkerCount() const {
  if (options_.workers > 0) {
    return options_.workers;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

std::vector<PairDistance> PairScanner::ScanBlock(const std::vector<hash::HashPair>& hashes, std::size_t block_index) const {
  const std::size_t n     = hashes.size();
  const std::size_t begin = block_index * options_.block_rows;
  const std::size_t end   = std::min(n, begin + options_.block_rows);

  std::vector<PairDistance> kept;
  for (std::size_t i = begin; i < end; ++i) {
    const auto& a = hashes[i];
    for (std::size_t j = i + 1; j < n; ++j) {
      const auto& b = hashes[j];

      const unsigned          primary = hash::HammingDistance(a.primary, b.primary);
      std::optional<unsigned> secondary;
      if (a.secondary && b.secondary) {
        secondary = hash::HammingDistance(*a.secondary, *b.secondary);
      }

      if (!filter_(primary, secondary)) {
        continue;
      }

      PairDistance pair;
      pair.first   = static_cast<std::uint32_t>(i);
      pair.second  = static_cast<std::uint32_t>(j);
      pair.primary = static_cast<std::uint16_t>(primary);
      if (secondary) {
        pair.secondary = static_cast<std::uint16_t>(*secondary);
      }
      kept.push_back(pair);
    }
  }
  return kept;
}

void PairScanner::Scan(const std::vector<hash::HashPair>& hashes, std::size_t first_block, const BlockSink& sink) const {
  const std::size_t block_count = BlockCount(hashes.size());
  const std::size_t workers     = WorkerCount();

  // one wave = up to `workers` consecutive blocks; the sink sees a wave only
  // after all of its blocks are done, in block order
  for (std::size_t wave_begin = first_block; wave_begin < block_count; wave_begin += workers) {
    const std::size_t wave_end = std::min(block_count, wave_begin + workers);
    const std::size_t wave     = wave_end - wave_begin;

    std::vector<std::vector<PairDistance>> results(wave);
    std::vector<std::exception_ptr>        errors(wave);

    if (wave == 1) {
      results[0] = ScanBlock(hashes, wave_begin);
    } else {
      std::vector<std::thread> threads;
      threads.reserve(wave);
      for (std::size_t w = 0; w < wave; ++w) {
        threads.emplace_back([&, w] {
          try {
            results[w] = ScanBlock(hashes, wave_begin + w);
          } catch (...) {
            errors[w] = std::current_exception();
          }
        });
      }
      for (auto& thread : threads) {
        thread.join();
      }
      for (const auto& error : errors) {
        if (error) {
          std::rethrow_exception(error);
        }
      }
    }

    for (std::size_t w = 0; w < wave; ++w) {
      sink(wave_begin + w, std::move(results[w]));
    }
  }
}

} // namespace photosift::grouping
