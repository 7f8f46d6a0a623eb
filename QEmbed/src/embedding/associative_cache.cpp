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

#include <algorithm>
#include <base/debug/logger.hpp>
#include <embedding/associative_cache.hpp>

namespace QEmbed {

namespace {

// MurmurHash3 64-bit finalizer.
inline uint64_t mix64(uint64_t h) {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdull;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ull;
  h ^= h >> 33;
  return h;
}

size_t compute_num_sets(const AssociativeCacheParams& params) {
  QEMB_THROW_IF(params.associativity == 0, Error_t::WrongInput,
                "Cache associativity must be positive.");
  QEMB_THROW_IF(params.max_row_floats == 0, Error_t::WrongInput,
                "Cache lines must hold at least one value.");

  size_t capacity_rows{params.capacity_rows};
  if (capacity_rows == 0) {
    capacity_rows = params.capacity_bytes / (params.max_row_floats * sizeof(float));
  }
  QEMB_THROW_IF(capacity_rows == 0, Error_t::WrongInput,
                "Cache capacity must allow for at least one row.");
  return std::max<size_t>((capacity_rows + params.associativity - 1) / params.associativity, 1);
}

}  // namespace

AssociativeCache::AssociativeCache(const AssociativeCacheParams& params)
    : algorithm_{params.algorithm},
      associativity_{params.associativity},
      max_row_floats_{params.max_row_floats},
      num_sets_{compute_num_sets(params)},
      metas_(num_sets_ * associativity_),
      arena_(num_sets_ * associativity_ * max_row_floats_),
      set_guards_(num_sets_) {
  QEMB_LOG_S(INFO, ROOT) << "Created " << algorithm_ << " cache with " << num_sets_ << " sets x "
                         << associativity_ << " ways of " << max_row_floats_ << " floats ("
                         << (arena_.size() * sizeof(float)) << " bytes)." << std::endl;
}

size_t AssociativeCache::set_index(const size_t table_id, const int64_t row) const {
  const uint64_t key{static_cast<uint64_t>(row) ^
                     (static_cast<uint64_t>(table_id) * 0x9e3779b97f4a7c15ull)};
  return static_cast<size_t>(mix64(key) % num_sets_);
}

size_t AssociativeCache::find_way(const size_t set, const size_t table_id,
                                  const int64_t row) const {
  for (size_t way = 0; way < associativity_; ++way) {
    const LineMeta& m{meta(set, way)};
    if (m.valid && m.table_id == table_id && m.row == row) {
      return way;
    }
  }
  return associativity_;
}

size_t AssociativeCache::select_victim(const size_t set) const {
  size_t victim{0};
  for (size_t way = 0; way < associativity_; ++way) {
    const LineMeta& m{meta(set, way)};
    if (!m.valid) {
      return way;
    }
    const LineMeta& v{meta(set, victim)};
    switch (algorithm_) {
      case CacheAlgorithm_t::LRU:
        if (m.last_access < v.last_access) {
          victim = way;
        }
        break;
      case CacheAlgorithm_t::LFU:
        if (m.access_count < v.access_count ||
            (m.access_count == v.access_count && m.last_access < v.last_access)) {
          victim = way;
        }
        break;
      default:
        QEMB_DIE("Unsupported cache algorithm %d.", static_cast<int>(algorithm_));
    }
  }
  return victim;
}

bool AssociativeCache::get_or_fetch(const size_t table_id, const int64_t row, const size_t dim,
                                    const FetchFn& fetch_fn, float* const out) {
  QEMB_THROW_IF(dim > max_row_floats_, Error_t::OutOfBound,
                "Row of dimension " + std::to_string(dim) + " exceeds the cache line width " +
                    std::to_string(max_row_floats_) + ".");

  const size_t set{set_index(table_id, row)};
  const std::lock_guard<std::mutex> lock(set_guards_[set]);
  const uint64_t now{++clock_};

  size_t way{find_way(set, table_id, row)};
  if (way != associativity_) {
    LineMeta& m{meta(set, way)};
    QEMB_THROW_IF(m.dim != dim, Error_t::WrongInput,
                  "Table " + std::to_string(table_id) + " was cached with dimension " +
                      std::to_string(m.dim) + ", but is accessed with " + std::to_string(dim) +
                      ".");
    m.last_access = now;
    ++m.access_count;
    const float* const src{line(set, way)};
    std::copy(src, src + dim, out);
    ++hits_;
    return true;
  }
  ++misses_;

  // Fetch before touching the victim, so that a failing fetch leaves the set intact.
  fetch_fn(out);

  way = select_victim(set);
  QEMB_CHECK(way < associativity_);
  LineMeta& m{meta(set, way)};
  if (m.valid) {
    ++evictions_;
    QEMB_LOG_C(TRACE, ROOT, "Cache set ", set, " evicts (", m.table_id, ", ", m.row,
               ") for (", table_id, ", ", row, ").\n");
  }
  m.valid = true;
  m.table_id = table_id;
  m.row = row;
  m.dim = dim;
  m.last_access = now;
  m.access_count = 1;
  std::copy(out, out + dim, line(set, way));
  return false;
}

bool AssociativeCache::contains(const size_t table_id, const int64_t row) const {
  const size_t set{set_index(table_id, row)};
  const std::lock_guard<std::mutex> lock(set_guards_[set]);
  return find_way(set, table_id, row) != associativity_;
}

bool AssociativeCache::update(const size_t table_id, const int64_t row, const size_t dim,
                              const float* const values) {
  QEMB_THROW_IF(dim > max_row_floats_, Error_t::OutOfBound,
                "Row of dimension " + std::to_string(dim) + " exceeds the cache line width " +
                    std::to_string(max_row_floats_) + ".");

  const size_t set{set_index(table_id, row)};
  const std::lock_guard<std::mutex> lock(set_guards_[set]);
  const size_t way{find_way(set, table_id, row)};
  if (way == associativity_) {
    return false;
  }
  meta(set, way).dim = dim;
  std::copy(values, values + dim, line(set, way));
  return true;
}

bool AssociativeCache::invalidate(const size_t table_id, const int64_t row) {
  const size_t set{set_index(table_id, row)};
  const std::lock_guard<std::mutex> lock(set_guards_[set]);
  const size_t way{find_way(set, table_id, row)};
  if (way == associativity_) {
    return false;
  }
  meta(set, way).valid = false;
  return true;
}

size_t AssociativeCache::invalidate_table(const size_t table_id) {
  size_t num_dropped{0};
  for (size_t set = 0; set < num_sets_; ++set) {
    const std::lock_guard<std::mutex> lock(set_guards_[set]);
    for (size_t way = 0; way < associativity_; ++way) {
      LineMeta& m{meta(set, way)};
      if (m.valid && m.table_id == table_id) {
        m.valid = false;
        ++num_dropped;
      }
    }
  }
  QEMB_LOG_C(DEBUG, ROOT, "Dropped ", num_dropped, " cached rows of table ", table_id, ".\n");
  return num_dropped;
}

void AssociativeCache::reset() {
  for (size_t set = 0; set < num_sets_; ++set) {
    const std::lock_guard<std::mutex> lock(set_guards_[set]);
    for (size_t way = 0; way < associativity_; ++way) {
      meta(set, way) = LineMeta{};
    }
  }
}

size_t AssociativeCache::size() const {
  size_t num_valid{0};
  for (size_t set = 0; set < num_sets_; ++set) {
    const std::lock_guard<std::mutex> lock(set_guards_[set]);
    for (size_t way = 0; way < associativity_; ++way) {
      num_valid += meta(set, way).valid ? 1 : 0;
    }
  }
  return num_valid;
}

CacheStats AssociativeCache::get_stats() const {
  return {hits_.load(), misses_.load(), evictions_.load()};
}

void AssociativeCache::reset_stats() {
  hits_ = 0;
  misses_ = 0;
  evictions_ = 0;
}

}  // namespace QEmbed
