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

#include <base/debug/logger.hpp>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace QEmbed {

#define QEMBED_VERSION_MAJOR 1
#define QEMBED_VERSION_MINOR 0
#define QEMBED_VERSION_PATCH 0

/**
 * An internal exception, as a child of std::runtime_error, to carry the error code.
 */
class internal_runtime_error : public std::runtime_error {
 private:
  const Error_t err_;

 public:
  /**
   * Get the error code from exception.
   * @return error
   **/
  Error_t get_error() const { return err_; }
  /**
   * Ctor
   */
  internal_runtime_error(Error_t err, std::string str) : runtime_error(str), err_(err) {}
};

/**
 * Storage encoding of an embedding row or of a pooled output row.
 */
enum class SparseType_t { FP32, FP16, BF16, INT8, INT4, INT2, FP8 };
constexpr size_t NUM_SPARSE_TYPES{7};

enum class PoolingMode_t { Sum, Mean, None };

enum class EmbeddingLocation_t { Host, Device, ManagedCaching };

enum class CacheAlgorithm_t { LRU, LFU };

enum class IndexRemapping_t { Array, Hash };

constexpr const char* qemb_enum_to_c_str(const SparseType_t value) {
  // Remark: Dependent functions assume lower-case, and underscore separated.
  switch (value) {
    case SparseType_t::FP32:
      return "fp32";
    case SparseType_t::FP16:
      return "fp16";
    case SparseType_t::BF16:
      return "bf16";
    case SparseType_t::INT8:
      return "int8";
    case SparseType_t::INT4:
      return "int4";
    case SparseType_t::INT2:
      return "int2";
    case SparseType_t::FP8:
      return "fp8";
    default:
      return "<unknown SparseType_t value>";
  }
}
constexpr const char* qemb_enum_to_c_str(const PoolingMode_t value) {
  switch (value) {
    case PoolingMode_t::Sum:
      return "sum";
    case PoolingMode_t::Mean:
      return "mean";
    case PoolingMode_t::None:
      return "none";
    default:
      return "<unknown PoolingMode_t value>";
  }
}
constexpr const char* qemb_enum_to_c_str(const EmbeddingLocation_t value) {
  switch (value) {
    case EmbeddingLocation_t::Host:
      return "host";
    case EmbeddingLocation_t::Device:
      return "device";
    case EmbeddingLocation_t::ManagedCaching:
      return "managed_caching";
    default:
      return "<unknown EmbeddingLocation_t value>";
  }
}
constexpr const char* qemb_enum_to_c_str(const CacheAlgorithm_t value) {
  switch (value) {
    case CacheAlgorithm_t::LRU:
      return "lru";
    case CacheAlgorithm_t::LFU:
      return "lfu";
    default:
      return "<unknown CacheAlgorithm_t value>";
  }
}
constexpr const char* qemb_enum_to_c_str(const IndexRemapping_t value) {
  switch (value) {
    case IndexRemapping_t::Array:
      return "array";
    case IndexRemapping_t::Hash:
      return "hash";
    default:
      return "<unknown IndexRemapping_t value>";
  }
}

std::ostream& operator<<(std::ostream& os, SparseType_t value);
std::ostream& operator<<(std::ostream& os, PoolingMode_t value);
std::ostream& operator<<(std::ostream& os, EmbeddingLocation_t value);
std::ostream& operator<<(std::ostream& os, CacheAlgorithm_t value);
std::ostream& operator<<(std::ostream& os, IndexRemapping_t value);

}  // namespace QEmbed
