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

#include <omp.h>

#include <base/debug/logger.hpp>
#include <embedding/output_quantizer.hpp>
#include <exception>
#include <numeric>

namespace QEmbed {

OutputQuantizer::OutputQuantizer(const SparseType_t output_type) : output_type_{output_type} {
  QEMB_THROW_IF(!is_supported(output_type_), Error_t::UnSupportedFormat,
                std::string("Lookup output cannot be encoded as ") +
                    qemb_enum_to_c_str(output_type_) + ".");
}

bool OutputQuantizer::is_supported(const SparseType_t type) {
  switch (type) {
    case SparseType_t::FP32:
    case SparseType_t::FP16:
    case SparseType_t::BF16:
    case SparseType_t::INT8:
    case SparseType_t::INT4:
    case SparseType_t::INT2:
      return true;
    default:
      return false;
  }
}

size_t OutputQuantizer::segment_size_in_bytes(const size_t dim, const SparseType_t type) {
  QEMB_THROW_IF(!is_supported(type), Error_t::UnSupportedFormat,
                std::string("Lookup output cannot be encoded as ") + qemb_enum_to_c_str(type) +
                    ".");
  return RowCodec::row_size_in_bytes(dim, type);
}

void OutputQuantizer::quantize(const float* const row, const size_t dim, uint8_t* const out) const {
  codec_.encode(row, dim, output_type_, out);
}

void OutputQuantizer::dequantize(const uint8_t* const in, const size_t dim,
                                 float* const out) const {
  codec_.decode(in, segment_size_in_bytes(dim), dim, output_type_, out);
}

void OutputQuantizer::quantize_rows(const float* const rows, const size_t num_rows,
                                    const size_t dim, uint8_t* const out,
                                    const size_t stride) const {
  std::exception_ptr error;
#pragma omp parallel for schedule(static)
  for (int64_t i = 0; i < static_cast<int64_t>(num_rows); ++i) {
    try {
      quantize(&rows[i * dim], dim, &out[i * stride]);
    } catch (...) {
#pragma omp critical
      if (!error) {
        error = std::current_exception();
      }
    }
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

void OutputQuantizer::dequantize_rows(const uint8_t* const in, const size_t num_rows,
                                      const size_t dim, const size_t stride,
                                      float* const out) const {
  const size_t segment_size{segment_size_in_bytes(dim)};
#pragma omp parallel for schedule(static)
  for (int64_t i = 0; i < static_cast<int64_t>(num_rows); ++i) {
    codec_.decode(&in[i * stride], segment_size, dim, output_type_, &out[i * dim]);
  }
}

size_t LookupOutput::total_dim() const {
  return std::accumulate(segment_dims.begin(), segment_dims.end(), size_t{0});
}

std::vector<float> LookupOutput::dequantize() const {
  const OutputQuantizer quantizer{type};
  const size_t width{total_dim()};
  std::vector<float> values(num_rows * width);
  if (num_rows == 0) {
    return values;
  }

  size_t column{0};
  std::vector<float> segment_values;
  for (size_t t = 0; t < num_segments(); ++t) {
    const size_t dim{segment_dims[t]};
    segment_values.resize(num_rows * dim);
    quantizer.dequantize_rows(bytes.data() + segment_offsets[t], num_rows, dim, row_size_in_bytes,
                              segment_values.data());
    for (size_t r = 0; r < num_rows; ++r) {
      std::copy_n(&segment_values[r * dim], dim, &values[r * width + column]);
    }
    column += dim;
  }
  return values;
}

std::vector<float> LookupOutput::segment(const size_t table, const size_t row) const {
  QEMB_THROW_IF(table >= num_segments() || row >= num_rows, Error_t::OutOfBound,
                "Segment (" + std::to_string(table) + ", " + std::to_string(row) +
                    ") is outside of the lookup output.");
  std::vector<float> values(segment_dims[table]);
  OutputQuantizer{type}.dequantize(row_data(row) + segment_offsets[table], values.size(),
                                   values.data());
  return values;
}

}  // namespace QEmbed
