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

#include <common.hpp>
#include <embedding/row_codec.hpp>
#include <inference_utils.hpp>
#include <parser.hpp>
#include <utility>

namespace QEmbed {

std::ostream& operator<<(std::ostream& os, const SparseType_t value) {
  return os << qemb_enum_to_c_str(value);
}
std::ostream& operator<<(std::ostream& os, const PoolingMode_t value) {
  return os << qemb_enum_to_c_str(value);
}
std::ostream& operator<<(std::ostream& os, const EmbeddingLocation_t value) {
  return os << qemb_enum_to_c_str(value);
}
std::ostream& operator<<(std::ostream& os, const CacheAlgorithm_t value) {
  return os << qemb_enum_to_c_str(value);
}
std::ostream& operator<<(std::ostream& os, const IndexRemapping_t value) {
  return os << qemb_enum_to_c_str(value);
}

namespace {

template <typename Enum>
using EnumAliases = std::vector<std::pair<Enum, std::vector<const char*>>>;

template <typename Enum>
Enum get_enum(const nlohmann::json& json, const std::string& key, const Enum default_value,
              const EnumAliases<Enum>& aliases) {
  if (json.find(key) == json.end()) {
    return default_value;
  }
  const std::string tmp{get_value_from_json<std::string>(json, key)};
  for (const auto& entry : aliases) {
    if (tmp == qemb_enum_to_c_str(entry.first)) {
      return entry.first;
    }
    for (const char* name : entry.second) {
      if (tmp == name) {
        return entry.first;
      }
    }
  }
  QEMB_OWN_THROW(Error_t::WrongInput, "Unable to parse '" + tmp + "' for key '" + key + "'.");
  return default_value;
}

}  // namespace

SparseType_t get_sparse_type(const nlohmann::json& json, const std::string& key,
                             const SparseType_t default_value) {
  static const EnumAliases<SparseType_t> aliases{
      {SparseType_t::FP32, {"float", "float32"}}, {SparseType_t::FP16, {"half", "float16"}},
      {SparseType_t::BF16, {"bfloat16"}},         {SparseType_t::INT8, {"uint8"}},
      {SparseType_t::INT4, {"uint4"}},            {SparseType_t::INT2, {"uint2"}},
      {SparseType_t::FP8, {"float8"}},
  };
  return get_enum(json, key, default_value, aliases);
}

PoolingMode_t get_pooling_mode(const nlohmann::json& json, const std::string& key,
                               const PoolingMode_t default_value) {
  static const EnumAliases<PoolingMode_t> aliases{
      {PoolingMode_t::Sum, {}},
      {PoolingMode_t::Mean, {"avg", "average"}},
      {PoolingMode_t::None, {"nobag", "concat"}},
  };
  return get_enum(json, key, default_value, aliases);
}

EmbeddingLocation_t get_embedding_location(const nlohmann::json& json, const std::string& key,
                                           const EmbeddingLocation_t default_value) {
  static const EnumAliases<EmbeddingLocation_t> aliases{
      {EmbeddingLocation_t::Host, {"cpu"}},
      {EmbeddingLocation_t::Device, {"gpu"}},
      {EmbeddingLocation_t::ManagedCaching, {"caching", "uvm_caching", "managed"}},
  };
  return get_enum(json, key, default_value, aliases);
}

CacheAlgorithm_t get_cache_algorithm(const nlohmann::json& json, const std::string& key,
                                     const CacheAlgorithm_t default_value) {
  static const EnumAliases<CacheAlgorithm_t> aliases{
      {CacheAlgorithm_t::LRU, {"least_recently_used"}},
      {CacheAlgorithm_t::LFU, {"least_frequently_used"}},
  };
  return get_enum(json, key, default_value, aliases);
}

IndexRemapping_t get_index_remapping_type(const nlohmann::json& json, const std::string& key,
                                          const IndexRemapping_t default_value) {
  static const EnumAliases<IndexRemapping_t> aliases{
      {IndexRemapping_t::Array, {"dense"}},
      {IndexRemapping_t::Hash, {"hashmap", "hash_map"}},
  };
  return get_enum(json, key, default_value, aliases);
}

TableSpec::TableSpec(const size_t table_id, const std::string& name, const size_t num_rows,
                     const size_t embedding_dim, const SparseType_t weight_type,
                     const EmbeddingLocation_t location)
    : table_id{table_id},
      name{name},
      num_rows{num_rows},
      embedding_dim{embedding_dim},
      weight_type{weight_type},
      location{location} {
  validate();
}

TableSpec::TableSpec(const nlohmann::json& json)
    : table_id{get_value_from_json<size_t>(json, "table_id")},
      name{get_value_from_json_soft<std::string>(json, "name",
                                                 "table_" + std::to_string(table_id))},
      num_rows{get_value_from_json<size_t>(json, "num_rows")},
      embedding_dim{get_value_from_json<size_t>(json, "embedding_dim")},
      weight_type{get_sparse_type(json, "weight_type", SparseType_t::FP32)},
      location{get_embedding_location(json, "location", EmbeddingLocation_t::Host)} {
  validate();
}

void TableSpec::validate() const {
  QEMB_THROW_IF(num_rows == 0, Error_t::WrongInput,
                "Table '" + name + "' must have at least one row.");
  QEMB_THROW_IF(embedding_dim == 0, Error_t::WrongInput,
                "Table '" + name + "' must have a non-zero embedding dimension.");
  const size_t alignment{RowCodec::packing_alignment(weight_type)};
  QEMB_THROW_IF(embedding_dim % alignment != 0, Error_t::WrongInput,
                "Table '" + name + "': " + qemb_enum_to_c_str(weight_type) +
                    " rows require the embedding dimension to be a multiple of " +
                    std::to_string(alignment) + ", got " + std::to_string(embedding_dim) + ".");
}

size_t TableSpec::row_size_in_bytes() const {
  return RowCodec::row_size_in_bytes(embedding_dim, weight_type);
}

bool TableSpec::operator==(const TableSpec& p) const {
  return table_id == p.table_id && name == p.name && num_rows == p.num_rows &&
         embedding_dim == p.embedding_dim && weight_type == p.weight_type &&
         location == p.location;
}
bool TableSpec::operator!=(const TableSpec& p) const { return !operator==(p); }

AssociativeCacheParams::AssociativeCacheParams(const CacheAlgorithm_t algorithm,
                                               const size_t associativity,
                                               const size_t capacity_rows,
                                               const size_t capacity_bytes,
                                               const size_t max_row_floats)
    : algorithm{algorithm},
      associativity{associativity},
      capacity_rows{capacity_rows},
      capacity_bytes{capacity_bytes},
      max_row_floats{max_row_floats} {}

AssociativeCacheParams::AssociativeCacheParams(const nlohmann::json& json)
    : AssociativeCacheParams() {
  algorithm = get_cache_algorithm(json, "algorithm", algorithm);
  associativity = get_value_from_json_soft(json, "associativity", associativity);
  capacity_rows = get_value_from_json_soft(json, "capacity_rows", capacity_rows);
  capacity_bytes = get_value_from_json_soft(json, "capacity_bytes", capacity_bytes);
  max_row_floats = get_value_from_json_soft(json, "max_row_floats", max_row_floats);
}

bool AssociativeCacheParams::operator==(const AssociativeCacheParams& p) const {
  return algorithm == p.algorithm && associativity == p.associativity &&
         capacity_rows == p.capacity_rows && capacity_bytes == p.capacity_bytes &&
         max_row_floats == p.max_row_floats;
}
bool AssociativeCacheParams::operator!=(const AssociativeCacheParams& p) const {
  return !operator==(p);
}

LookupEngineParams::LookupEngineParams(
    const std::vector<TableSpec>& tables, const PoolingMode_t pooling_mode,
    const SparseType_t output_type, const std::optional<AssociativeCacheParams>& cache,
    const size_t num_workers, const size_t max_bags_per_task, const int fp8_exponent_bits,
    const int fp8_exponent_bias, const IndexRemapping_t remapping_type,
    const float remapping_load_factor, const std::vector<std::vector<int32_t>>& index_remappings)
    : tables{tables},
      pooling_mode{pooling_mode},
      output_type{output_type},
      cache{cache},
      num_workers{num_workers},
      max_bags_per_task{max_bags_per_task},
      fp8_exponent_bits{fp8_exponent_bits},
      fp8_exponent_bias{fp8_exponent_bias},
      remapping_type{remapping_type},
      remapping_load_factor{remapping_load_factor},
      index_remappings{index_remappings} {}

LookupEngineParams::LookupEngineParams(const nlohmann::json& json)
    : LookupEngineParams(std::vector<TableSpec>{}) {
  pooling_mode = get_pooling_mode(json, "pooling_mode", pooling_mode);
  output_type = get_sparse_type(json, "output_type", output_type);
  num_workers = get_value_from_json_soft(json, "num_workers", num_workers);
  max_bags_per_task = get_value_from_json_soft(json, "max_bags_per_task", max_bags_per_task);
  fp8_exponent_bits = get_value_from_json_soft(json, "fp8_exponent_bits", fp8_exponent_bits);
  fp8_exponent_bias = get_value_from_json_soft(json, "fp8_exponent_bias", fp8_exponent_bias);

  if (has_key_(json, "cache") && !json.find("cache")->is_null()) {
    cache.emplace(get_json(json, "cache"));
  }

  if (has_key_(json, "index_remapping")) {
    const nlohmann::json& remapping = get_json(json, "index_remapping");
    remapping_type = get_index_remapping_type(remapping, "type", remapping_type);
    remapping_load_factor =
        get_value_from_json_soft(remapping, "load_factor", remapping_load_factor);
  }

  const nlohmann::json& tables_json = get_json(json, "tables");
  bool has_remapping{false};
  std::vector<std::vector<int32_t>> remappings;
  for (size_t i = 0; i < tables_json.size(); ++i) {
    const nlohmann::json& table_json = tables_json[i];
    tables.emplace_back(table_json);
    if (has_key_(table_json, "index_remapping")) {
      remappings.emplace_back(
          get_json(table_json, "index_remapping").get<std::vector<int32_t>>());
      has_remapping = true;
    } else {
      remappings.emplace_back();
    }
  }
  if (has_remapping) {
    index_remappings = std::move(remappings);
  }

  QEMB_LOG_S(INFO, ROOT) << "Parsed lookup engine configuration: " << tables.size()
                         << " tables, pooling " << pooling_mode << ", output " << output_type
                         << ", cache " << (cache ? qemb_enum_to_c_str(cache->algorithm) : "off")
                         << '.' << std::endl;
}

LookupEngineParams::LookupEngineParams(const std::string& json_config_file)
    : LookupEngineParams(read_json_file(json_config_file)) {}

LookupEngineParams::LookupEngineParams(const char* const json_config_file)
    : LookupEngineParams(std::string(json_config_file)) {}

}  // namespace QEmbed
