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
#include <embedding/embedding_table.hpp>
#include <embedding/row_codec.hpp>

namespace QEmbed {

EmbeddingTable::EmbeddingTable(const TableSpec& spec)
    : spec_{spec}, row_size_{spec.row_size_in_bytes()} {
  spec_.validate();
  weights_.resize(spec_.num_rows * row_size_, 0);
  QEMB_LOG_C(DEBUG, ROOT, "Table '", spec_.name, "' (", spec_.table_id, "): ", spec_.num_rows,
             " x ", spec_.embedding_dim, " ", spec_.weight_type, ", ", weights_.size(),
             " bytes, location ", spec_.location, ".\n");
}

void EmbeddingTable::check_index(const int64_t index) const {
  QEMB_THROW_IF(index < 0 || static_cast<size_t>(index) >= spec_.num_rows, Error_t::OutOfBound,
                "Row " + std::to_string(index) + " is outside of table '" + spec_.name +
                    "' with " + std::to_string(spec_.num_rows) + " rows.");
}

const uint8_t* EmbeddingTable::row(const int64_t index) const {
  check_index(index);
  return &weights_[static_cast<size_t>(index) * row_size_];
}

void EmbeddingTable::assign_row(const int64_t index, const uint8_t* const bytes,
                                const size_t num_bytes) {
  check_index(index);
  QEMB_THROW_IF(num_bytes != row_size_, Error_t::FormatMismatch,
                "Rows of table '" + spec_.name + "' have " + std::to_string(row_size_) +
                    " bytes, got " + std::to_string(num_bytes) + ".");
  std::copy(bytes, bytes + num_bytes, &weights_[static_cast<size_t>(index) * row_size_]);
}

void EmbeddingTable::assign_weights(const uint8_t* const bytes, const size_t num_bytes) {
  QEMB_THROW_IF(num_bytes != weights_.size(), Error_t::FormatMismatch,
                "Table '" + spec_.name + "' has " + std::to_string(weights_.size()) +
                    " bytes, got " + std::to_string(num_bytes) + ".");
  std::copy(bytes, bytes + num_bytes, weights_.begin());
}

std::pair<std::vector<uint8_t>, std::vector<uint8_t>> EmbeddingTable::split_weights() const {
  const size_t payload_size{
      RowCodec::payload_size_in_bytes(spec_.embedding_dim, spec_.weight_type)};
  const size_t suffix_size{row_size_ - payload_size};

  std::vector<uint8_t> payloads;
  std::vector<uint8_t> scale_biases;
  payloads.reserve(spec_.num_rows * payload_size);
  scale_biases.reserve(spec_.num_rows * suffix_size);
  for (size_t i = 0; i < spec_.num_rows; ++i) {
    const auto first{weights_.begin() + i * row_size_};
    payloads.insert(payloads.end(), first, first + payload_size);
    scale_biases.insert(scale_biases.end(), first + payload_size, first + row_size_);
  }
  return {std::move(payloads), std::move(scale_biases)};
}

}  // namespace QEmbed
