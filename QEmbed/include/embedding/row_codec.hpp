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

#include <array>
#include <common.hpp>
#include <cstdint>
#include <vector>

namespace QEmbed {

using Row = std::vector<uint8_t>;

struct Fp8Params {
  int exponent_bits{4};
  int exponent_bias{7};
};

/**
 * Converts single embedding rows between their packed byte layout and float32.
 *
 * Layout of a row with D elements:
 *   [ payload: ceil(D * bit_rate / 8) bytes ][ scale: fp16 ][ bias: fp16 ]
 * The scale/bias suffix only exists for INT8, INT4 and INT2. Sub-byte elements are packed low
 * bits first, multi-byte scalars are little-endian.
 */
class RowCodec final {
 public:
  explicit RowCodec(const Fp8Params& fp8_params = {});

  static uint32_t bit_rate(SparseType_t type);
  static bool has_scale_bias(SparseType_t type);
  static size_t packing_alignment(SparseType_t type);
  static size_t payload_size_in_bytes(size_t dim, SparseType_t type);
  static size_t scale_bias_size_in_bytes(SparseType_t type);
  static size_t row_size_in_bytes(size_t dim, SparseType_t type);

  /**
   * Encodes `dim` floats into `out`, which must provide `row_size_in_bytes(dim, type)` bytes.
   */
  void encode(const float* values, size_t dim, SparseType_t type, uint8_t* out) const;
  Row encode(const float* values, size_t dim, SparseType_t type) const;

  /**
   * Builds an integer row from raw codes and an explicit scale/bias pair.
   */
  static Row encode_quantized(const uint8_t* codes, size_t dim, SparseType_t type, float scale,
                              float bias);

  void decode(const uint8_t* bytes, size_t num_bytes, size_t dim, SparseType_t type,
              float* out) const;
  std::vector<float> decode(const Row& row, size_t dim, SparseType_t type) const;

  /**
   * Affine parameters of one row, with `scale` and `bias` exactly as they are restored from their
   * fp16 representation. Elements equal to the row minimum take `min_code`, elements equal to the
   * row maximum take `max_code`, all others round to the nearest code.
   *
   * The parameters are chosen so that re-encoding a decoded row reproduces the same bytes.
   */
  struct AffineParams {
    float scale;
    float bias;
    uint32_t min_code;
    uint32_t max_code;
  };

  /**
   * Affine quantization shared with the output path.
   */
  static AffineParams compute_scale_bias(const float* values, size_t dim, uint32_t bit_rate);
  static void quantize_affine(const float* values, size_t dim, uint32_t bit_rate, uint8_t* out);
  static void dequantize_affine(const uint8_t* bytes, size_t dim, uint32_t bit_rate, float* out);

  uint8_t float_to_fp8(float value) const;
  float fp8_to_float(uint8_t code) const { return fp8_values_[code]; }
  float fp8_max() const { return fp8_values_[0x7F]; }

  const Fp8Params& fp8_params() const { return fp8_params_; }

 private:
  const Fp8Params fp8_params_;
  std::array<float, 256> fp8_values_;
};

}  // namespace QEmbed
