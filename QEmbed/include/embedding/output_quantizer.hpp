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
#include <embedding/row_codec.hpp>
#include <vector>

namespace QEmbed {

/**
 * Converts pooled float32 rows into the output encoding. FP32, FP16 and BF16 are passed through,
 * INT8 uses the affine row layout of RowCodec: D codes followed by fp16 scale and bias. INT4 and
 * INT2 share the RowCodec layouts as well; the engine only emits them for unpooled rows that are
 * stored in that format.
 */
class OutputQuantizer final {
 public:
  explicit OutputQuantizer(SparseType_t output_type);

  SparseType_t output_type() const { return output_type_; }

  static bool is_supported(SparseType_t type);
  static size_t segment_size_in_bytes(size_t dim, SparseType_t type);
  size_t segment_size_in_bytes(size_t dim) const {
    return segment_size_in_bytes(dim, output_type_);
  }

  void quantize(const float* row, size_t dim, uint8_t* out) const;
  void dequantize(const uint8_t* in, size_t dim, float* out) const;

  /**
   * Batched forms. Input/output rows are `dim` floats apart, encoded rows `stride` bytes apart.
   */
  void quantize_rows(const float* rows, size_t num_rows, size_t dim, uint8_t* out,
                     size_t stride) const;
  void dequantize_rows(const uint8_t* in, size_t num_rows, size_t dim, size_t stride,
                       float* out) const;

 private:
  const SparseType_t output_type_;
  const RowCodec codec_;
};

/**
 * Result of a lookup. Each of the `num_rows` rows is the concatenation of one encoded segment
 * per table (a single segment for unpooled lookups).
 */
struct LookupOutput {
  SparseType_t type;
  size_t num_rows;
  size_t row_size_in_bytes;
  std::vector<size_t> segment_offsets;
  std::vector<size_t> segment_dims;
  std::vector<uint8_t> bytes;

  size_t num_segments() const { return segment_dims.size(); }
  size_t total_dim() const;
  const uint8_t* row_data(size_t row) const { return bytes.data() + row * row_size_in_bytes; }

  /**
   * Decodes everything into a `num_rows x total_dim()` float matrix.
   */
  std::vector<float> dequantize() const;

  std::vector<float> segment(size_t table, size_t row) const;
};

}  // namespace QEmbed
