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

#include <base/debug/logger.hpp>
#include <cmath>
#include <embedding/index_remapping.hpp>
#include <limits>
#include <type_traits>

namespace QEmbed {

namespace {

void check_remapping(const std::vector<int32_t>& remapping) {
  QEMB_THROW_IF(remapping.empty(), Error_t::WrongInput, "Remapping array must not be empty.");
  QEMB_THROW_IF(remapping.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max()),
                Error_t::WrongInput, "Remapping array exceeds the 32 bit index range.");
  for (size_t i = 0; i < remapping.size(); ++i) {
    QEMB_THROW_IF(remapping[i] < PRUNED_ROW, Error_t::WrongInput,
                  "Remapping entry " + std::to_string(i) + " is negative (" +
                      std::to_string(remapping[i]) + ").");
  }
}

}  // namespace

std::unique_ptr<IndexRemapping> IndexRemapping::create(const IndexRemapping_t type,
                                                       const std::vector<int32_t>& remapping,
                                                       const float load_factor) {
  switch (type) {
    case IndexRemapping_t::Array:
      return std::make_unique<ArrayIndexRemapping>(remapping);
    case IndexRemapping_t::Hash:
      return std::make_unique<HashIndexRemapping>(remapping, load_factor);
    default:
      QEMB_OWN_THROW(Error_t::WrongInput, "Unknown index remapping type.");
  }
  return nullptr;
}

ArrayIndexRemapping::ArrayIndexRemapping(const std::vector<int32_t>& remapping)
    : remapping_{remapping} {
  check_remapping(remapping_);
}

HashIndexRemapping::HashIndexRemapping(const std::vector<int32_t>& remapping,
                                       const float load_factor)
    : num_logical_rows_{remapping.size()} {
  check_remapping(remapping);
  QEMB_THROW_IF(!(load_factor > 0.f && load_factor <= 1.f), Error_t::WrongInput,
                "Hash remapping load factor must be within (0, 1], got " +
                    std::to_string(load_factor) + ".");

  const size_t capacity{static_cast<size_t>(
      std::ceil(static_cast<double>(remapping.size()) / static_cast<double>(load_factor)))};
  slots_.resize(capacity, Slot{PRUNED_ROW, PRUNED_ROW});

  for (size_t i = 0; i < remapping.size(); ++i) {
    if (remapping[i] != PRUNED_ROW) {
      insert(static_cast<int32_t>(i), remapping[i]);
    }
  }
  QEMB_LOG_C(DEBUG, ROOT, "Hash remapping holds ", num_entries_, " of ", num_logical_rows_,
             " rows in ", capacity, " slots.\n");
}

uint32_t HashIndexRemapping::hash(uint32_t key) {
  key ^= key >> 16;
  key *= 0x85ebca6b;
  key ^= key >> 13;
  key *= 0xc2b2ae35;
  key ^= key >> 16;
  return key;
}

void HashIndexRemapping::insert(const int32_t key, const int32_t value) {
  size_t slot{primary_slot(key)};
  for (size_t step = 0; step < slots_.size(); ++step) {
    Slot& s{slots_[slot]};
    if (s.key == PRUNED_ROW) {
      s = {key, value};
      ++num_entries_;
      return;
    }
    if (s.key == key) {
      s.value = value;
      return;
    }
    slot = (slot + 1) % slots_.size();
  }
  QEMB_OWN_THROW(Error_t::OutOfMemory, "Hash remapping is full.");
}

int64_t HashIndexRemapping::lookup(const int32_t logical_index) const {
  size_t slot{primary_slot(logical_index)};
  for (size_t step = 0; step < slots_.size(); ++step) {
    const Slot& s{slots_[slot]};
    if (s.key == logical_index) {
      return s.value;
    }
    if (s.key == PRUNED_ROW) {
      break;
    }
    slot = (slot + 1) % slots_.size();
  }
  return PRUNED_ROW;
}

void IndexResolver::add_table(const size_t table_id, const size_t num_rows,
                              std::unique_ptr<IndexRemapping> remapping) {
  QEMB_THROW_IF(contains(table_id), Error_t::WrongInput,
                "Table " + std::to_string(table_id) + " was already registered.");
  if (remapping) {
    QEMB_THROW_IF(remapping->num_logical_rows() != num_rows, Error_t::WrongInput,
                  "Remapping of table " + std::to_string(table_id) + " describes " +
                      std::to_string(remapping->num_logical_rows()) + " rows, but the table has " +
                      std::to_string(num_rows) + ".");
    for (size_t i = 0; i < num_rows; ++i) {
      const int64_t row{remapping->lookup(static_cast<int32_t>(i))};
      QEMB_THROW_IF(row >= static_cast<int64_t>(num_rows), Error_t::WrongInput,
                    "Remapping of table " + std::to_string(table_id) + " maps row " +
                        std::to_string(i) + " outside of the table.");
    }
  }
  tables_.emplace(table_id, TableEntry{num_rows, std::move(remapping)});
}

const IndexResolver::TableEntry& IndexResolver::get_entry(const size_t table_id) const {
  const auto it{tables_.find(table_id)};
  QEMB_THROW_IF(it == tables_.end(), Error_t::WrongInput,
                "Table " + std::to_string(table_id) + " is unknown.");
  return it->second;
}

template <typename TypeIndex>
int64_t IndexResolver::resolve_entry(const TableEntry& entry, const size_t table_id,
                                     const TypeIndex logical_index) {
  if (logical_index < 0 || static_cast<size_t>(logical_index) >= entry.num_rows) {
    QEMB_OWN_THROW(Error_t::IndexOutOfRange,
                   "Index " + std::to_string(logical_index) + " is out of range for table " +
                       std::to_string(table_id) + " with " + std::to_string(entry.num_rows) +
                       " rows.");
  }
  if (!entry.remapping) {
    return static_cast<int64_t>(logical_index);
  }
  if constexpr (!std::is_same_v<TypeIndex, int32_t>) {
    QEMB_THROW_IF(entry.remapping->type() == IndexRemapping_t::Hash,
                  Error_t::UnsupportedIndexWidth,
                  "Table " + std::to_string(table_id) +
                      " uses hash remapping, which only accepts 32 bit indices.");
  }
  return entry.remapping->lookup(static_cast<int32_t>(logical_index));
}

template <typename TypeIndex>
std::optional<int64_t> IndexResolver::resolve(const size_t table_id,
                                              const TypeIndex logical_index) const {
  const int64_t row{resolve_entry(get_entry(table_id), table_id, logical_index)};
  if (row == PRUNED_ROW) {
    return std::nullopt;
  }
  return row;
}

template <typename TypeIndex>
void IndexResolver::remap(const size_t table_id, const TypeIndex* const indices,
                          const size_t num_indices, int64_t* const out) const {
  const TableEntry& entry{get_entry(table_id)};
  for (size_t i = 0; i < num_indices; ++i) {
    out[i] = resolve_entry(entry, table_id, indices[i]);
  }
}

template std::optional<int64_t> IndexResolver::resolve(size_t, int32_t) const;
template std::optional<int64_t> IndexResolver::resolve(size_t, int64_t) const;
template void IndexResolver::remap(size_t, const int32_t*, size_t, int64_t*) const;
template void IndexResolver::remap(size_t, const int64_t*, size_t, int64_t*) const;

}  // namespace QEmbed
