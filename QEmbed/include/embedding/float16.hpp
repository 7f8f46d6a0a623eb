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
#include <cstring>

namespace QEmbed {

// Host-side binary16 / bfloat16 conversions. All narrowing conversions round to nearest even.

inline uint32_t float_as_bits(const float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

inline float bits_as_float(const uint32_t bits) {
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

inline uint16_t float_to_half(const float value) {
  uint32_t x{float_as_bits(value)};
  const uint32_t sign{(x >> 16) & 0x8000u};
  x &= 0x7FFFFFFFu;

  // Inf / NaN.
  if (x >= 0x7F800000u) {
    return static_cast<uint16_t>(sign | 0x7C00u | (x > 0x7F800000u ? 0x0200u : 0u));
  }
  // 65520 and above round to Inf.
  if (x >= 0x477FF000u) {
    return static_cast<uint16_t>(sign | 0x7C00u);
  }
  // Subnormal range of binary16, below 2^-14.
  if (x < 0x38800000u) {
    if (x < 0x33000000u) {
      return static_cast<uint16_t>(sign);
    }
    const uint32_t exponent{x >> 23};
    const uint32_t mantissa{(x & 0x7FFFFFu) | 0x800000u};
    const uint32_t shift{126u - exponent};
    uint32_t r{mantissa >> shift};
    const uint32_t rem{mantissa & ((1u << shift) - 1u)};
    const uint32_t halfway{1u << (shift - 1u)};
    if (rem > halfway || (rem == halfway && (r & 1u))) {
      ++r;
    }
    return static_cast<uint16_t>(sign | r);
  }

  // Normal range. Rebias exponent from 127 to 15 and drop 13 mantissa bits.
  uint32_t r{x - 0x38000000u};
  const uint32_t rem{r & 0x1FFFu};
  r >>= 13;
  if (rem > 0x1000u || (rem == 0x1000u && (r & 1u))) {
    ++r;
  }
  return static_cast<uint16_t>(sign | r);
}

inline float half_to_float(const uint16_t value) {
  const uint32_t sign{static_cast<uint32_t>(value & 0x8000u) << 16};
  const uint32_t exponent{(value >> 10) & 0x1Fu};
  const uint32_t mantissa{value & 0x3FFu};

  if (exponent == 0) {
    // Zero or subnormal: mantissa * 2^-24 is exact in binary32.
    const float magnitude{static_cast<float>(mantissa) * 5.9604644775390625e-8f};
    return sign ? -magnitude : magnitude;
  }
  if (exponent == 0x1F) {
    return bits_as_float(sign | 0x7F800000u | (mantissa << 13));
  }
  return bits_as_float(sign | ((exponent + 112u) << 23) | (mantissa << 13));
}

inline uint16_t float_to_bfloat16(const float value) {
  const uint32_t x{float_as_bits(value)};
  if ((x & 0x7FFFFFFFu) > 0x7F800000u) {
    return static_cast<uint16_t>((x >> 16) | 0x0040u);
  }
  const uint32_t rounding_bias{0x7FFFu + ((x >> 16) & 1u)};
  return static_cast<uint16_t>((x + rounding_bias) >> 16);
}

inline float bfloat16_to_float(const uint16_t value) {
  return bits_as_float(static_cast<uint32_t>(value) << 16);
}

// Little-endian scalar IO, so that the byte layout does not depend on the host.
inline void store_u16_le(uint8_t* const dst, const uint16_t value) {
  dst[0] = static_cast<uint8_t>(value & 0xFFu);
  dst[1] = static_cast<uint8_t>(value >> 8);
}

inline uint16_t load_u16_le(const uint8_t* const src) {
  return static_cast<uint16_t>(src[0] | (static_cast<uint16_t>(src[1]) << 8));
}

inline void store_u32_le(uint8_t* const dst, const uint32_t value) {
  dst[0] = static_cast<uint8_t>(value & 0xFFu);
  dst[1] = static_cast<uint8_t>((value >> 8) & 0xFFu);
  dst[2] = static_cast<uint8_t>((value >> 16) & 0xFFu);
  dst[3] = static_cast<uint8_t>(value >> 24);
}

inline uint32_t load_u32_le(const uint8_t* const src) {
  return static_cast<uint32_t>(src[0]) | (static_cast<uint32_t>(src[1]) << 8) |
         (static_cast<uint32_t>(src[2]) << 16) | (static_cast<uint32_t>(src[3]) << 24);
}

}  // namespace QEmbed
