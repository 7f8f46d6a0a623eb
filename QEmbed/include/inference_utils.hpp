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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace QEmbed {

SparseType_t get_sparse_type(const nlohmann::json& json, const std::string& key,
                             SparseType_t default_value);
PoolingMode_t get_pooling_mode(const nlohmann::json& json, const std::string& key,
                               PoolingMode_t default_value);
EmbeddingLocation_t get_embedding_location(const nlohmann::json& json, const std::string& key,
                                           EmbeddingLocation_t default_value);
CacheAlgorithm_t get_cache_algorithm(const nlohmann::json& json, const std::string& key,
                                     CacheAlgorithm_t default_value);
IndexRemapping_t get_index_remapping_type(const nlohmann::json& json, const std::string& key,
                                          IndexRemapping_t default_value);

/**
 * Describes one embedding table. Validated on construction.
 */
struct TableSpec {
  size_t table_id;
  std::string name;
  size_t num_rows;
  size_t embedding_dim;
  SparseType_t weight_type;
  EmbeddingLocation_t location;

  TableSpec(size_t table_id, const std::string& name, size_t num_rows, size_t embedding_dim,
            SparseType_t weight_type = SparseType_t::FP32,
            EmbeddingLocation_t location = EmbeddingLocation_t::Host);
  explicit TableSpec(const nlohmann::json& json);

  void validate() const;

  size_t row_size_in_bytes() const;

  bool operator==(const TableSpec& p) const;
  bool operator!=(const TableSpec& p) const;
};

struct AssociativeCacheParams {
  CacheAlgorithm_t algorithm;
  size_t associativity;   // 1 = direct-mapped.
  size_t capacity_rows;   // Takes precedence over `capacity_bytes` if not 0.
  size_t capacity_bytes;  // Bytes of decoded float rows.
  size_t max_row_floats;  // Width of a line. 0 = derived from the tables.

  AssociativeCacheParams(CacheAlgorithm_t algorithm = CacheAlgorithm_t::LRU,
                         size_t associativity = 32, size_t capacity_rows = 0,
                         size_t capacity_bytes = 64 * 1024 * 1024, size_t max_row_floats = 0);
  explicit AssociativeCacheParams(const nlohmann::json& json);

  bool operator==(const AssociativeCacheParams& p) const;
  bool operator!=(const AssociativeCacheParams& p) const;
};

struct LookupEngineParams {
  std::vector<TableSpec> tables;
  PoolingMode_t pooling_mode;
  SparseType_t output_type;
  std::optional<AssociativeCacheParams> cache;
  size_t num_workers;        // 0 = QEMB_DEFAULT_CONCURRENCY or hardware concurrency.
  size_t max_bags_per_task;  // Granularity of the (table, bag range) work split.
  int fp8_exponent_bits;
  int fp8_exponent_bias;

  // Pruning. `index_remappings` is either empty or holds one array per table, where an empty
  // array disables remapping of that table.
  IndexRemapping_t remapping_type;
  float remapping_load_factor;
  std::vector<std::vector<int32_t>> index_remappings;

  LookupEngineParams(const std::vector<TableSpec>& tables,
                     PoolingMode_t pooling_mode = PoolingMode_t::Sum,
                     SparseType_t output_type = SparseType_t::FP32,
                     const std::optional<AssociativeCacheParams>& cache = std::nullopt,
                     size_t num_workers = 0, size_t max_bags_per_task = 256,
                     int fp8_exponent_bits = 4, int fp8_exponent_bias = 7,
                     IndexRemapping_t remapping_type = IndexRemapping_t::Array,
                     float remapping_load_factor = 0.5f,
                     const std::vector<std::vector<int32_t>>& index_remappings = {});
  explicit LookupEngineParams(const nlohmann::json& json);
  explicit LookupEngineParams(const std::string& json_config_file);
  explicit LookupEngineParams(const char* json_config_file);
};

}  // namespace QEmbed
