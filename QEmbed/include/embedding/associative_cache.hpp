/*
 * Copyright (c) 2023, NVIDIA CORPORATION.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <atomic>
#include <common.hpp>
#include <core/macro.hpp>
#include <cstdint>
#include <functional>
#include <inference_utils.hpp>
#include <mutex>
#include <vector>

namespace QEmbed {

struct CacheStats {
  uint64_t hits;
  uint64_t misses;
  uint64_t evictions;
};

/**
 * Fixed capacity set-associative cache of decoded embedding rows.
 *
 * Lines are keyed by (table_id, row) and live in a preallocated arena of
 * `num_sets * associativity` slots of `max_row_floats` floats each. Every set is guarded by its
 * own mutex, which serializes lookup, victim selection, fetch and overwrite within the set. A
 * key therefore occupies at most one line at any time.
 */
class AssociativeCache final {
 public:
  /**
   * Decodes a row from the backing store into the provided buffer.
   */
  using FetchFn = std::function<void(float* row)>;

  explicit AssociativeCache(const AssociativeCacheParams& params);

  QEMB_DISALLOW_COPY_AND_MOVE(AssociativeCache);

  /**
   * Copies the `dim` floats of the row into `out`. On a miss, `fetch_fn` fills `out` and the row
   * replaces a victim line of its set.
   *
   * @return true on a hit.
   */
  bool get_or_fetch(size_t table_id, int64_t row, size_t dim, const FetchFn& fetch_fn,
                    float* out);

  bool contains(size_t table_id, int64_t row) const;

  /**
   * Overwrites the line of a resident row. Does not count as an access.
   *
   * @return true if the row was resident.
   */
  bool update(size_t table_id, int64_t row, size_t dim, const float* values);

  bool invalidate(size_t table_id, int64_t row);

  /**
   * @return Number of lines dropped.
   */
  size_t invalidate_table(size_t table_id);

  void reset();

  size_t set_index(size_t table_id, int64_t row) const;
  size_t num_sets() const { return num_sets_; }
  size_t associativity() const { return associativity_; }
  size_t capacity() const { return num_sets_ * associativity_; }
  size_t max_row_floats() const { return max_row_floats_; }
  CacheAlgorithm_t algorithm() const { return algorithm_; }

  /**
   * Number of valid lines.
   */
  size_t size() const;

  CacheStats get_stats() const;
  void reset_stats();

 private:
  struct LineMeta {
    bool valid{false};
    size_t table_id{0};
    int64_t row{0};
    size_t dim{0};
    uint64_t last_access{0};
    uint64_t access_count{0};
  };

  size_t find_way(size_t set, size_t table_id, int64_t row) const;
  size_t select_victim(size_t set) const;

  LineMeta& meta(const size_t set, const size_t way) {
    return metas_[set * associativity_ + way];
  }
  const LineMeta& meta(const size_t set, const size_t way) const {
    return metas_[set * associativity_ + way];
  }
  float* line(const size_t set, const size_t way) {
    return &arena_[(set * associativity_ + way) * max_row_floats_];
  }

  const CacheAlgorithm_t algorithm_;
  const size_t associativity_;
  const size_t max_row_floats_;
  const size_t num_sets_;

  std::vector<LineMeta> metas_;
  std::vector<float> arena_;
  mutable std::vector<std::mutex> set_guards_;

  std::atomic<uint64_t> clock_{0};
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> evictions_{0};
};

}  // namespace QEmbed
