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

#include <common.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace QEmbed {

constexpr int32_t PRUNED_ROW{-1};

/**
 * Immutable logical row -> physical row map of a single table. Built once at load time.
 */
class IndexRemapping {
 public:
  virtual ~IndexRemapping() = default;

  virtual IndexRemapping_t type() const = 0;

  /**
   * Number of logical rows that were described at construction.
   */
  virtual size_t num_logical_rows() const = 0;

  /**
   * Returns the physical row of `logical_index`, or PRUNED_ROW. The caller range-checks.
   */
  virtual int64_t lookup(int32_t logical_index) const = 0;

  /**
   * @param type Remapping strategy.
   * @param remapping Physical row or PRUNED_ROW for every logical row.
   * @param load_factor Hash mode only. Fill ratio of the open addressing table, in (0, 1].
   */
  static std::unique_ptr<IndexRemapping> create(IndexRemapping_t type,
                                                const std::vector<int32_t>& remapping,
                                                float load_factor = 0.5f);
};

class ArrayIndexRemapping final : public IndexRemapping {
 public:
  explicit ArrayIndexRemapping(const std::vector<int32_t>& remapping);

  IndexRemapping_t type() const override { return IndexRemapping_t::Array; }
  size_t num_logical_rows() const override { return remapping_.size(); }
  int64_t lookup(const int32_t logical_index) const override { return remapping_[logical_index]; }

 private:
  const std::vector<int32_t> remapping_;
};

/**
 * Open addressing with linear probing. A slot whose key is PRUNED_ROW is empty, and reaching an
 * empty slot during lookup means the row was pruned.
 */
class HashIndexRemapping final : public IndexRemapping {
 public:
  struct Slot {
    int32_t key;
    int32_t value;
  };

  HashIndexRemapping(const std::vector<int32_t>& remapping, float load_factor);

  IndexRemapping_t type() const override { return IndexRemapping_t::Hash; }
  size_t num_logical_rows() const override { return num_logical_rows_; }
  int64_t lookup(int32_t logical_index) const override;

  size_t capacity() const { return slots_.size(); }
  size_t size() const { return num_entries_; }
  const std::vector<Slot>& slots() const { return slots_; }

  /**
   * MurmurHash3 32-bit finalizer.
   */
  static uint32_t hash(uint32_t key);
  size_t primary_slot(int32_t key) const { return hash(static_cast<uint32_t>(key)) % capacity(); }

 private:
  void insert(int32_t key, int32_t value);

  const size_t num_logical_rows_;
  size_t num_entries_{0};
  std::vector<Slot> slots_;
};

/**
 * Resolves logical indices of every registered table to physical rows. Tables without a remapping
 * resolve to themselves.
 */
class IndexResolver final {
 public:
  IndexResolver() = default;

  void add_table(size_t table_id, size_t num_rows,
                 std::unique_ptr<IndexRemapping> remapping = nullptr);

  /**
   * @return The physical row, or std::nullopt if the row was pruned.
   */
  template <typename TypeIndex>
  std::optional<int64_t> resolve(size_t table_id, TypeIndex logical_index) const;

  /**
   * Bulk form of resolve(). Pruned entries are written as PRUNED_ROW.
   */
  template <typename TypeIndex>
  void remap(size_t table_id, const TypeIndex* indices, size_t num_indices, int64_t* out) const;

  bool contains(size_t table_id) const { return tables_.find(table_id) != tables_.end(); }
  size_t num_rows(size_t table_id) const { return get_entry(table_id).num_rows; }
  const IndexRemapping* remapping(size_t table_id) const {
    return get_entry(table_id).remapping.get();
  }

 private:
  struct TableEntry {
    size_t num_rows;
    std::unique_ptr<IndexRemapping> remapping;
  };

  const TableEntry& get_entry(size_t table_id) const;

  template <typename TypeIndex>
  static int64_t resolve_entry(const TableEntry& entry, size_t table_id, TypeIndex logical_index);

  std::unordered_map<size_t, TableEntry> tables_;
};

}  // namespace QEmbed
