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

#include <cstdint>
#include <inference_utils.hpp>
#include <utility>
#include <vector>

namespace QEmbed {

/**
 * Host resident backing store of one table: `num_rows` packed rows, back to back. Rows start out
 * zeroed. Not synchronized; the owner serializes writers against readers.
 */
class EmbeddingTable final {
 public:
  explicit EmbeddingTable(const TableSpec& spec);

  const TableSpec& spec() const { return spec_; }
  size_t row_size_in_bytes() const { return row_size_; }
  size_t size_in_bytes() const { return weights_.size(); }
  const uint8_t* data() const { return weights_.data(); }

  const uint8_t* row(int64_t index) const;

  void assign_row(int64_t index, const uint8_t* bytes, size_t num_bytes);

  /**
   * Replaces all rows at once. `num_bytes` must equal `size_in_bytes()`.
   */
  void assign_weights(const uint8_t* bytes, size_t num_bytes);

  /**
   * Splits the table into its packed payloads and, for integer formats, the per-row scale/bias
   * suffixes. The second buffer is empty for formats without a suffix.
   */
  std::pair<std::vector<uint8_t>, std::vector<uint8_t>> split_weights() const;

 private:
  void check_index(int64_t index) const;

  const TableSpec spec_;
  const size_t row_size_;
  std::vector<uint8_t> weights_;
};

}  // namespace QEmbed
