// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_PART_COUNTER_HPP
#define CIRRUS_PART_COUNTER_HPP

#include <atomic>

namespace cirrus {
namespace uploader {

/**
 * Hands out part numbers 1, 2, 3, ... to concurrently running part tasks.
 * Every number is returned exactly once.
 */
class PartCounter {
public:
  PartCounter() = default;
  PartCounter(const PartCounter&) = delete;
  PartCounter& operator=(const PartCounter&) = delete;

  int next() { return next_.fetch_add(1); }

  /**
   * Number the next call to next() would return
   */
  int peek() const { return next_.load(); }

private:
  std::atomic<int> next_{1};
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_PART_COUNTER_HPP
