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

#include <core/macro.hpp>
#include <cstdint>
#include <embedding/associative_cache.hpp>
#include <embedding/embedding_table.hpp>
#include <embedding/index_remapping.hpp>
#include <embedding/output_quantizer.hpp>
#include <embedding/row_codec.hpp>
#include <inference_utils.hpp>
#include <memory>
#include <shared_mutex>
#include <thread_pool.hpp>
#include <vector>

namespace QEmbed {

/**
 * Bags of one table in CSR form. Bag `b` spans `indices[offsets[b], offsets[b + 1])`.
 * `per_sample_weights` is either empty or holds one weight per index.
 */
template <typename TypeIndex>
struct TableBatch {
  size_t table_id;
  std::vector<TypeIndex> offsets;
  std::vector<TypeIndex> indices;
  std::vector<float> per_sample_weights;

  size_t num_bags() const { return offsets.empty() ? 0 : offsets.size() - 1; }
};

/**
 * Serves pooled lookups over a fixed set of quantized tables.
 *
 * forward() may be called concurrently. It holds shared locks on the tables it reads, while
 * assign_row() and assign_table_weights() take the exclusive lock of the table they write and
 * then bring the cache up to date.
 */
class LookupEngine final {
 public:
  explicit LookupEngine(const LookupEngineParams& params);

  QEMB_DISALLOW_COPY_AND_MOVE(LookupEngine);

  /**
   * Looks up one batch per table, in declaration order.
   *
   * SUM and MEAN produce one output row per bag, made of one segment per table. NONE produces
   * one single-segment row per index, stacked table after table.
   */
  template <typename TypeIndex>
  LookupOutput forward(const std::vector<TableBatch<TypeIndex>>& batches);

  /**
   * Overwrites physical row `row` of the table at position `table`.
   */
  void assign_row(size_t table, int64_t row, const uint8_t* bytes, size_t num_bytes);
  void assign_row(size_t table, int64_t row, const Row& bytes) {
    assign_row(table, row, bytes.data(), bytes.size());
  }

  void assign_table_weights(size_t table, const uint8_t* bytes, size_t num_bytes);
  void assign_table_weights(size_t table, const std::vector<uint8_t>& bytes) {
    assign_table_weights(table, bytes.data(), bytes.size());
  }

  const LookupEngineParams& params() const { return params_; }
  size_t num_tables() const { return tables_.size(); }
  const EmbeddingTable& get_table(size_t table) const;
  const IndexResolver& resolver() const { return resolver_; }
  const RowCodec& codec() const { return codec_; }
  bool has_cache() const { return cache_ != nullptr; }
  bool is_cached(size_t table) const;

  /**
   * All zero if the engine runs without a cache.
   */
  CacheStats cache_stats() const;
  void reset_cache();

  /**
   * Bytes per output row for the configured pooling mode.
   */
  size_t total_output_width() const;

 private:
  void check_table(size_t table) const;

  /**
   * Decoded row, served by the cache if the table is cached.
   */
  void fetch_row(size_t table, int64_t row, float* out);
  void decode_row(size_t table, int64_t row, float* out) const;

  template <typename TypeIndex>
  void validate(const std::vector<TableBatch<TypeIndex>>& batches) const;

  /**
   * Pools bags [first_bag, last_bag). Bag `b` (pooled) or index `i` (NONE) is written to
   * `out + b * stride` or `out + i * stride`.
   */
  template <typename TypeIndex>
  void lookup_bags(size_t table, const TableBatch<TypeIndex>& batch, size_t first_bag,
                   size_t last_bag, uint8_t* out, size_t stride);

  const LookupEngineParams params_;
  const RowCodec codec_;
  const OutputQuantizer quantizer_;
  std::vector<EmbeddingTable> tables_;
  mutable std::vector<std::shared_mutex> table_guards_;
  IndexResolver resolver_;
  std::unique_ptr<AssociativeCache> cache_;
  std::vector<bool> cached_;
  ThreadPool pool_;
};

}  // namespace QEmbed
