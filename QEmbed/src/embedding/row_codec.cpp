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
#include <cmath>
#include <embedding/float16.hpp>
#include <embedding/row_codec.hpp>
#include <limits>

namespace QEmbed {

namespace {

constexpr size_t SCALE_BIAS_SIZE_IN_BYTES{2 * sizeof(uint16_t)};
constexpr float FP16_MAX{65504.0f};

using EncodeFn = void (*)(const RowCodec&, const float*, size_t, uint8_t*);
using DecodeFn = void (*)(const RowCodec&, const uint8_t*, size_t, float*);

void encode_fp32(const RowCodec&, const float* const values, const size_t dim, uint8_t* const out) {
  for (size_t i = 0; i < dim; ++i) {
    store_u32_le(&out[i * sizeof(float)], float_as_bits(values[i]));
  }
}

void decode_fp32(const RowCodec&, const uint8_t* const bytes, const size_t dim, float* const out) {
  for (size_t i = 0; i < dim; ++i) {
    out[i] = bits_as_float(load_u32_le(&bytes[i * sizeof(float)]));
  }
}

void encode_fp16(const RowCodec&, const float* const values, const size_t dim, uint8_t* const out) {
  for (size_t i = 0; i < dim; ++i) {
    store_u16_le(&out[i * sizeof(uint16_t)], float_to_half(values[i]));
  }
}

void decode_fp16(const RowCodec&, const uint8_t* const bytes, const size_t dim, float* const out) {
  for (size_t i = 0; i < dim; ++i) {
    out[i] = half_to_float(load_u16_le(&bytes[i * sizeof(uint16_t)]));
  }
}

void encode_bf16(const RowCodec&, const float* const values, const size_t dim, uint8_t* const out) {
  for (size_t i = 0; i < dim; ++i) {
    store_u16_le(&out[i * sizeof(uint16_t)], float_to_bfloat16(values[i]));
  }
}

void decode_bf16(const RowCodec&, const uint8_t* const bytes, const size_t dim, float* const out) {
  for (size_t i = 0; i < dim; ++i) {
    out[i] = bfloat16_to_float(load_u16_le(&bytes[i * sizeof(uint16_t)]));
  }
}

template <uint32_t BitRate>
void encode_int(const RowCodec&, const float* const values, const size_t dim, uint8_t* const out) {
  RowCodec::quantize_affine(values, dim, BitRate, out);
}

template <uint32_t BitRate>
void decode_int(const RowCodec&, const uint8_t* const bytes, const size_t dim, float* const out) {
  RowCodec::dequantize_affine(bytes, dim, BitRate, out);
}

void encode_fp8(const RowCodec& codec, const float* const values, const size_t dim,
                uint8_t* const out) {
  for (size_t i = 0; i < dim; ++i) {
    out[i] = codec.float_to_fp8(values[i]);
  }
}

void decode_fp8(const RowCodec& codec, const uint8_t* const bytes, const size_t dim,
                float* const out) {
  for (size_t i = 0; i < dim; ++i) {
    out[i] = codec.fp8_to_float(bytes[i]);
  }
}

struct FormatTraits {
  SparseType_t type;
  uint32_t bit_rate;
  bool has_scale_bias;
  size_t packing_alignment;
  EncodeFn encode;
  DecodeFn decode;
};

// Indexed by SparseType_t.
constexpr std::array<FormatTraits, NUM_SPARSE_TYPES> FORMAT_TRAITS{{
    {SparseType_t::FP32, 32, false, 1, encode_fp32, decode_fp32},
    {SparseType_t::FP16, 16, false, 1, encode_fp16, decode_fp16},
    {SparseType_t::BF16, 16, false, 1, encode_bf16, decode_bf16},
    {SparseType_t::INT8, 8, true, 1, encode_int<8>, decode_int<8>},
    {SparseType_t::INT4, 4, true, 2, encode_int<4>, decode_int<4>},
    {SparseType_t::INT2, 2, true, 4, encode_int<2>, decode_int<2>},
    {SparseType_t::FP8, 8, false, 1, encode_fp8, decode_fp8},
}};

constexpr bool format_traits_complete() {
  for (size_t i = 0; i < FORMAT_TRAITS.size(); ++i) {
    if (static_cast<size_t>(FORMAT_TRAITS[i].type) != i || FORMAT_TRAITS[i].encode == nullptr ||
        FORMAT_TRAITS[i].decode == nullptr) {
      return false;
    }
  }
  return true;
}

static_assert(static_cast<size_t>(SparseType_t::FP8) + 1 == NUM_SPARSE_TYPES,
              "NUM_SPARSE_TYPES is out of sync with SparseType_t.");
static_assert(format_traits_complete(), "Every SparseType_t needs exactly one codec entry.");

const FormatTraits& get_traits(const SparseType_t type) {
  const size_t index{static_cast<size_t>(type)};
  QEMB_THROW_IF(index >= FORMAT_TRAITS.size(), Error_t::UnSupportedFormat,
                "Unknown sparse type: " + std::to_string(index));
  return FORMAT_TRAITS[index];
}

inline size_t payload_size(const size_t dim, const uint32_t bit_rate) {
  return (dim * bit_rate + 7) / 8;
}

// Nearest fp16 value, saturated to the finite range.
float round_to_half(const float value) {
  if (value == 0.f) {
    return 0.f;
  }
  const float rounded{half_to_float(float_to_half(value))};
  return std::isinf(rounded) ? std::copysign(FP16_MAX, value) : rounded;
}

// Largest fp16 value not above `value`, saturated to the finite range.
float floor_to_half(const float value) {
  if (value >= FP16_MAX) {
    return FP16_MAX;
  }
  if (value <= -FP16_MAX) {
    return -FP16_MAX;
  }
  uint16_t h{float_to_half(value)};
  if (half_to_float(h) > value) {
    h = (h & 0x8000u) ? h + 1 : h - 1;
  }
  const float floored{half_to_float(h)};
  return floored == 0.f ? 0.f : floored;
}

// Smallest fp16 value above the fp16 value `value`.
float next_half_up(const float value) {
  if (value >= FP16_MAX) {
    return std::numeric_limits<float>::infinity();
  }
  const uint16_t h{float_to_half(value)};
  return half_to_float((h & 0x8000u) && h != 0x8000u ? h - 1 : (h & 0x7FFFu) + 1);
}

// Scales below this bound would let fp32 rounding around `bias` disturb the decoded codes.
float min_scale(const float bias, const uint32_t max_code) {
  return std::max(round_to_half(std::ldexp(std::fabs(bias), -9) / static_cast<float>(max_code)),
                  std::ldexp(1.f, -24));
}

inline float affine_value(const uint32_t code, const float scale, const float bias) {
  return static_cast<float>(code) * scale + bias;
}

inline uint32_t nearest_code(const float value, const float bias, const float inverse_scale,
                             const uint32_t max_code) {
  return static_cast<uint32_t>(
      std::clamp(std::lrint((value - bias) * inverse_scale), 0l, static_cast<long>(max_code)));
}

// All elements share one value, which is stored in the bias.
RowCodec::AffineParams constant_params(const float value, const uint32_t max_code) {
  const float bias{round_to_half(value)};
  return {min_scale(bias, max_code), bias, 0, 0};
}

}  // namespace

RowCodec::RowCodec(const Fp8Params& fp8_params) : fp8_params_{fp8_params} {
  QEMB_THROW_IF(fp8_params_.exponent_bits < 1 || fp8_params_.exponent_bits > 7,
                Error_t::WrongInput,
                "FP8 exponent width must be within [1, 7] bits, got " +
                    std::to_string(fp8_params_.exponent_bits) + ".");

  // Positive codes in ascending order; the sign lives in the top bit. There are no Inf/NaN codes.
  const int mantissa_bits{7 - fp8_params_.exponent_bits};
  for (uint32_t code = 0; code < 0x80; ++code) {
    const int exponent{static_cast<int>(code >> mantissa_bits)};
    const uint32_t mantissa{code & ((1u << mantissa_bits) - 1u)};
    float magnitude;
    if (exponent == 0) {
      magnitude = std::ldexp(static_cast<float>(mantissa),
                             1 - fp8_params_.exponent_bias - mantissa_bits);
    } else {
      magnitude = std::ldexp(static_cast<float>((1u << mantissa_bits) | mantissa),
                             exponent - fp8_params_.exponent_bias - mantissa_bits);
    }
    fp8_values_[code] = magnitude;
    fp8_values_[code | 0x80] = -magnitude;
  }
  QEMB_THROW_IF(!std::isfinite(fp8_values_[0x7F]), Error_t::WrongInput,
                "FP8 exponent bias " + std::to_string(fp8_params_.exponent_bias) +
                    " exceeds the float32 range.");
}

uint32_t RowCodec::bit_rate(const SparseType_t type) { return get_traits(type).bit_rate; }

bool RowCodec::has_scale_bias(const SparseType_t type) { return get_traits(type).has_scale_bias; }

size_t RowCodec::packing_alignment(const SparseType_t type) {
  return get_traits(type).packing_alignment;
}

size_t RowCodec::payload_size_in_bytes(const size_t dim, const SparseType_t type) {
  return payload_size(dim, get_traits(type).bit_rate);
}

size_t RowCodec::scale_bias_size_in_bytes(const SparseType_t type) {
  return get_traits(type).has_scale_bias ? SCALE_BIAS_SIZE_IN_BYTES : 0;
}

size_t RowCodec::row_size_in_bytes(const size_t dim, const SparseType_t type) {
  return payload_size_in_bytes(dim, type) + scale_bias_size_in_bytes(type);
}

void RowCodec::encode(const float* const values, const size_t dim, const SparseType_t type,
                      uint8_t* const out) const {
  get_traits(type).encode(*this, values, dim, out);
}

Row RowCodec::encode(const float* const values, const size_t dim, const SparseType_t type) const {
  Row row(row_size_in_bytes(dim, type));
  encode(values, dim, type, row.data());
  return row;
}

Row RowCodec::encode_quantized(const uint8_t* const codes, const size_t dim,
                               const SparseType_t type, const float scale, const float bias) {
  const FormatTraits& traits{get_traits(type)};
  QEMB_THROW_IF(!traits.has_scale_bias, Error_t::UnSupportedFormat,
                std::string("Raw codes require an integer format, got ") +
                    qemb_enum_to_c_str(type) + ".");

  const uint32_t max_code{(1u << traits.bit_rate) - 1u};
  const uint32_t codes_per_byte{8 / traits.bit_rate};
  const size_t payload{payload_size(dim, traits.bit_rate)};

  Row row(payload + SCALE_BIAS_SIZE_IN_BYTES, 0);
  for (size_t i = 0; i < dim; ++i) {
    QEMB_THROW_IF(codes[i] > max_code, Error_t::OutOfBound,
                  "Code " + std::to_string(codes[i]) + " does not fit into " +
                      std::to_string(traits.bit_rate) + " bits.");
    row[i / codes_per_byte] |=
        static_cast<uint8_t>(codes[i] << ((i % codes_per_byte) * traits.bit_rate));
  }
  store_u16_le(&row[payload], float_to_half(scale));
  store_u16_le(&row[payload + sizeof(uint16_t)], float_to_half(bias));
  return row;
}

void RowCodec::decode(const uint8_t* const bytes, const size_t num_bytes, const size_t dim,
                      const SparseType_t type, float* const out) const {
  const size_t expected{row_size_in_bytes(dim, type)};
  QEMB_THROW_IF(num_bytes != expected, Error_t::FormatMismatch,
                std::string("A ") + qemb_enum_to_c_str(type) + " row of dimension " +
                    std::to_string(dim) + " has " + std::to_string(expected) + " bytes, got " +
                    std::to_string(num_bytes) + ".");
  get_traits(type).decode(*this, bytes, dim, out);
}

std::vector<float> RowCodec::decode(const Row& row, const size_t dim,
                                    const SparseType_t type) const {
  std::vector<float> values(dim);
  decode(row.data(), row.size(), dim, type, values.data());
  return values;
}

RowCodec::AffineParams RowCodec::compute_scale_bias(const float* const values, const size_t dim,
                                                    const uint32_t bit_rate) {
  const uint32_t max_code{(1u << bit_rate) - 1u};
  if (dim == 0) {
    return {1.f, 0.f, 0, 0};
  }

  const auto min_max{std::minmax_element(values, values + dim)};
  const float min_value{*min_max.first};
  const float max_value{*min_max.second};
  if (min_value == max_value) {
    return constant_params(min_value, max_code);
  }

  AffineParams params;
  params.bias = floor_to_half(min_value);
  const float lower_scale{min_scale(params.bias, max_code)};
  const float scale{
      round_to_half((max_value - params.bias) / static_cast<float>(max_code))};
  const bool pin_max{scale > lower_scale};
  params.scale = pin_max ? scale : lower_scale;

  const float inverse_scale{1.f / params.scale};
  params.max_code =
      pin_max ? max_code : nearest_code(max_value, params.bias, inverse_scale, max_code);

  // The decoded minimum must stay below the next fp16 value, or a second encode moves the bias.
  const float bias_limit{next_half_up(params.bias)};
  params.min_code = nearest_code(min_value, params.bias, inverse_scale, max_code);
  while (params.min_code > 0 &&
         affine_value(params.min_code, params.scale, params.bias) >= bias_limit) {
    --params.min_code;
  }

  if (params.min_code == params.max_code) {
    return constant_params(affine_value(params.min_code, params.scale, params.bias), max_code);
  }
  return params;
}

void RowCodec::quantize_affine(const float* const values, const size_t dim,
                               const uint32_t bit_rate, uint8_t* const out) {
  const AffineParams params{compute_scale_bias(values, dim, bit_rate)};

  const uint32_t max_code{(1u << bit_rate) - 1u};
  const uint32_t codes_per_byte{8 / bit_rate};
  const size_t payload{payload_size(dim, bit_rate)};
  const float inverse_scale{1.f / params.scale};

  float min_value{0.f}, max_value{0.f};
  if (dim > 0) {
    const auto min_max{std::minmax_element(values, values + dim)};
    min_value = *min_max.first;
    max_value = *min_max.second;
  }

  std::fill(out, out + payload, 0);
  for (size_t i = 0; i < dim; ++i) {
    uint32_t code;
    if (params.min_code == params.max_code || values[i] == min_value) {
      code = params.min_code;
    } else if (values[i] == max_value) {
      code = params.max_code;
    } else {
      code = nearest_code(values[i], params.bias, inverse_scale, max_code);
    }
    out[i / codes_per_byte] |= static_cast<uint8_t>(code << ((i % codes_per_byte) * bit_rate));
  }
  store_u16_le(&out[payload], float_to_half(params.scale));
  store_u16_le(&out[payload + sizeof(uint16_t)], float_to_half(params.bias));
}

void RowCodec::dequantize_affine(const uint8_t* const bytes, const size_t dim,
                                 const uint32_t bit_rate, float* const out) {
  const uint32_t max_code{(1u << bit_rate) - 1u};
  const uint32_t codes_per_byte{8 / bit_rate};
  const size_t payload{payload_size(dim, bit_rate)};
  const float scale{half_to_float(load_u16_le(&bytes[payload]))};
  const float bias{half_to_float(load_u16_le(&bytes[payload + sizeof(uint16_t)]))};

  for (size_t i = 0; i < dim; ++i) {
    const uint32_t code{(bytes[i / codes_per_byte] >> ((i % codes_per_byte) * bit_rate)) &
                        max_code};
    out[i] = affine_value(code, scale, bias);
  }
}

uint8_t RowCodec::float_to_fp8(const float value) const {
  if (std::isnan(value)) {
    return 0;
  }
  const uint8_t sign{static_cast<uint8_t>(std::signbit(value) ? 0x80 : 0)};
  const float magnitude{std::fabs(value)};
  if (magnitude >= fp8_max()) {
    return sign | 0x7F;
  }

  const auto first{fp8_values_.begin()};
  const uint32_t upper{
      static_cast<uint32_t>(std::lower_bound(first, first + 0x80, magnitude) - first)};
  if (upper == 0) {
    return sign;
  }
  const uint32_t lower{upper - 1};
  const float below{magnitude - fp8_values_[lower]};
  const float above{fp8_values_[upper] - magnitude};

  uint32_t code;
  if (below < above) {
    code = lower;
  } else if (above < below) {
    code = upper;
  } else {
    code = (lower & 1u) ? upper : lower;
  }
  return static_cast<uint8_t>(sign | code);
}

}  // namespace QEmbed
