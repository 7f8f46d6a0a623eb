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
#include <embedding/lookup_engine.hpp>
#include <future>
#include <mutex>

namespace QEmbed {

LookupEngine::LookupEngine(const LookupEngineParams& params)
    : params_{params},
      codec_{Fp8Params{params.fp8_exponent_bits, params.fp8_exponent_bias}},
      quantizer_{params.output_type},
      table_guards_(params.tables.size()),
      pool_{"lookup", params.num_workers} {
  const size_t num_tables{params_.tables.size()};
  QEMB_THROW_IF(num_tables == 0, Error_t::WrongInput,
                "A lookup engine requires at least one table.");
  QEMB_THROW_IF(!params_.index_remappings.empty() && params_.index_remappings.size() != num_tables,
                Error_t::WrongInput,
                "Got " + std::to_string(params_.index_remappings.size()) +
                    " index remappings for " + std::to_string(num_tables) + " tables.");
  QEMB_THROW_IF(params_.max_bags_per_task == 0, Error_t::WrongInput,
                "max_bags_per_task must be positive.");

  tables_.reserve(num_tables);
  size_t max_cached_dim{0};
  for (size_t t = 0; t < num_tables; ++t) {
    const TableSpec& spec{params_.tables[t]};
    tables_.emplace_back(spec);

    std::unique_ptr<IndexRemapping> remapping;
    if (!params_.index_remappings.empty() && !params_.index_remappings[t].empty()) {
      remapping = IndexRemapping::create(params_.remapping_type, params_.index_remappings[t],
                                         params_.remapping_load_factor);
    }
    resolver_.add_table(spec.table_id, spec.num_rows, std::move(remapping));

    QEMB_THROW_IF(RowCodec::bit_rate(params_.output_type) < 8 &&
                      (params_.pooling_mode != PoolingMode_t::None ||
                       spec.weight_type != params_.output_type),
                  Error_t::UnSupportedFormat,
                  std::string("Lookup output in ") + qemb_enum_to_c_str(params_.output_type) +
                      " is limited to unpooled lookups on tables of that type. Table '" +
                      spec.name + "' holds " + qemb_enum_to_c_str(spec.weight_type) +
                      " rows, pooling is " + qemb_enum_to_c_str(params_.pooling_mode) + ".");

    const bool cached{params_.cache && spec.location == EmbeddingLocation_t::ManagedCaching};
    cached_.push_back(cached);
    if (cached) {
      max_cached_dim = std::max(max_cached_dim, spec.embedding_dim);
    }
  }

  if (params_.cache) {
    if (max_cached_dim == 0) {
      QEMB_LOG_S(WARNING, ROOT) << "A cache was configured, but no table is placed at "
                                << EmbeddingLocation_t::ManagedCaching
                                << ". Rows are decoded directly." << std::endl;
    } else {
      AssociativeCacheParams cache_params{*params_.cache};
      if (cache_params.max_row_floats == 0) {
        cache_params.max_row_floats = max_cached_dim;
      }
      QEMB_THROW_IF(cache_params.max_row_floats < max_cached_dim, Error_t::WrongInput,
                    "Cache lines of " + std::to_string(cache_params.max_row_floats) +
                        " floats cannot hold rows of dimension " + std::to_string(max_cached_dim) +
                        ".");
      cache_ = std::make_unique<AssociativeCache>(cache_params);
    }
  }

  QEMB_LOG_S(INFO, ROOT) << "Lookup engine ready: " << num_tables << " tables, pooling "
                         << params_.pooling_mode << ", output " << params_.output_type << ", "
                         << pool_.size() << " workers." << std::endl;
  if (Logger::get().can_log_at(LOG_LEVEL(DEBUG), LOG_RANK(ROOT))) {
    QEMB_LOG(DEBUG, ROOT, "%-4s %-16s %12s %6s %6s %s\n", "id", "name", "rows", "dim", "type",
             "cached");
    for (size_t i = 0; i < num_tables; ++i) {
      const TableSpec& spec{tables_[i].spec()};
      QEMB_PRINT(DEBUG, "%-4zu %-16s %12zu %6zu %6s %s\n", spec.table_id, spec.name.c_str(),
                 spec.num_rows, spec.embedding_dim, qemb_enum_to_c_str(spec.weight_type),
                 cached_[i] && cache_ ? "yes" : "no");
    }
  }
}

void LookupEngine::check_table(const size_t table) const {
  QEMB_THROW_IF(table >= tables_.size(), Error_t::OutOfBound,
                "Table " + std::to_string(table) + " does not exist. The engine holds " +
                    std::to_string(tables_.size()) + " tables.");
}

const EmbeddingTable& LookupEngine::get_table(const size_t table) const {
  check_table(table);
  return tables_[table];
}

bool LookupEngine::is_cached(const size_t table) const {
  check_table(table);
  return cached_[table];
}

void LookupEngine::decode_row(const size_t table, const int64_t row, float* const out) const {
  const EmbeddingTable& source{tables_[table]};
  const TableSpec& spec{source.spec()};
  codec_.decode(source.row(row), source.row_size_in_bytes(), spec.embedding_dim, spec.weight_type,
                out);
}

void LookupEngine::fetch_row(const size_t table, const int64_t row, float* const out) {
  if (!cached_[table]) {
    decode_row(table, row, out);
    return;
  }
  const TableSpec& spec{tables_[table].spec()};
  cache_->get_or_fetch(
      spec.table_id, row, spec.embedding_dim,
      [this, table, row](float* const line) { decode_row(table, row, line); }, out);
}

template <typename TypeIndex>
void LookupEngine::validate(const std::vector<TableBatch<TypeIndex>>& batches) const {
  QEMB_THROW_IF(batches.size() != tables_.size(), Error_t::WrongInput,
                "Expected one batch per table (" + std::to_string(tables_.size()) + "), got " +
                    std::to_string(batches.size()) + ".");

  const PoolingMode_t mode{params_.pooling_mode};
  for (size_t t = 0; t < batches.size(); ++t) {
    const TableBatch<TypeIndex>& batch{batches[t]};
    const TableSpec& spec{tables_[t].spec()};
    const std::string name{"Batch " + std::to_string(t) + " (table " +
                           std::to_string(spec.table_id) + ")"};

    QEMB_THROW_IF(batch.table_id != spec.table_id, Error_t::WrongInput,
                  name + " is addressed to table " + std::to_string(batch.table_id) +
                      ". Batches must follow the table declaration order.");
    QEMB_THROW_IF(batch.offsets.empty(), Error_t::WrongInput,
                  name + ": offsets must hold B + 1 entries.");
    QEMB_THROW_IF(batch.offsets.front() != 0, Error_t::WrongInput,
                  name + ": offsets must start at 0.");
    for (size_t b = 0; b < batch.num_bags(); ++b) {
      QEMB_THROW_IF(batch.offsets[b + 1] < batch.offsets[b], Error_t::WrongInput,
                    name + ": offsets decrease at bag " + std::to_string(b) + ".");
    }
    QEMB_THROW_IF(static_cast<size_t>(batch.offsets.back()) != batch.indices.size(),
                  Error_t::WrongInput,
                  name + ": offsets end at " + std::to_string(batch.offsets.back()) + ", but " +
                      std::to_string(batch.indices.size()) + " indices were provided.");

    if (!batch.per_sample_weights.empty()) {
      QEMB_THROW_IF(mode != PoolingMode_t::Sum, Error_t::InvalidPoolingConfig,
                    name + ": per sample weights require sum pooling, not " +
                        qemb_enum_to_c_str(mode) + ".");
      QEMB_THROW_IF(batch.per_sample_weights.size() != batch.indices.size(), Error_t::WrongInput,
                    name + ": got " + std::to_string(batch.per_sample_weights.size()) +
                        " weights for " + std::to_string(batch.indices.size()) + " indices.");
    }

    if (mode == PoolingMode_t::None) {
      const size_t dim{tables_.front().spec().embedding_dim};
      QEMB_THROW_IF(spec.embedding_dim != dim, Error_t::PoolingShape,
                    name + ": unpooled rows of dimension " + std::to_string(spec.embedding_dim) +
                        " cannot be stacked with rows of dimension " + std::to_string(dim) + ".");
    } else {
      QEMB_THROW_IF(batch.num_bags() != batches.front().num_bags(), Error_t::WrongInput,
                    name + " holds " + std::to_string(batch.num_bags()) + " bags, batch 0 holds " +
                        std::to_string(batches.front().num_bags()) + ".");
    }
  }
}

template <typename TypeIndex>
void LookupEngine::lookup_bags(const size_t table, const TableBatch<TypeIndex>& batch,
                               const size_t first_bag, const size_t last_bag, uint8_t* const out,
                               const size_t stride) {
  const EmbeddingTable& source{tables_[table]};
  const TableSpec& spec{source.spec()};
  const size_t dim{spec.embedding_dim};
  const PoolingMode_t mode{params_.pooling_mode};
  // Unpooled rows already stored in the output type are copied as they are.
  const bool copy_rows{mode == PoolingMode_t::None && spec.weight_type == params_.output_type};
  const size_t first_index{static_cast<size_t>(batch.offsets[first_bag])};
  const size_t last_index{static_cast<size_t>(batch.offsets[last_bag])};

  std::vector<int64_t> rows(last_index - first_index);
  resolver_.remap(spec.table_id, batch.indices.data() + first_index, rows.size(), rows.data());

  std::vector<float> values(dim);
  std::vector<float> pooled(dim);
  for (size_t b = first_bag; b < last_bag; ++b) {
    const size_t begin{static_cast<size_t>(batch.offsets[b])};
    const size_t end{static_cast<size_t>(batch.offsets[b + 1])};

    if (mode == PoolingMode_t::None) {
      for (size_t i = begin; i < end; ++i) {
        const int64_t row{rows[i - first_index]};
        if (row == PRUNED_ROW) {
          std::fill(values.begin(), values.end(), 0.f);
        } else if (copy_rows) {
          std::copy_n(source.row(row), source.row_size_in_bytes(), out + i * stride);
          continue;
        } else {
          fetch_row(table, row, values.data());
        }
        quantizer_.quantize(values.data(), dim, out + i * stride);
      }
      continue;
    }

    std::fill(pooled.begin(), pooled.end(), 0.f);
    size_t num_pooled{0};
    for (size_t i = begin; i < end; ++i) {
      const int64_t row{rows[i - first_index]};
      if (row == PRUNED_ROW) {
        continue;
      }
      fetch_row(table, row, values.data());
      const float weight{batch.per_sample_weights.empty() ? 1.f : batch.per_sample_weights[i]};
      for (size_t j = 0; j < dim; ++j) {
        pooled[j] += weight * values[j];
      }
      ++num_pooled;
    }
    if (mode == PoolingMode_t::Mean && num_pooled > 0) {
      for (size_t j = 0; j < dim; ++j) {
        pooled[j] /= static_cast<float>(num_pooled);
      }
    }
    quantizer_.quantize(pooled.data(), dim, out + b * stride);
  }
}

template <typename TypeIndex>
LookupOutput LookupEngine::forward(const std::vector<TableBatch<TypeIndex>>& batches) {
  validate(batches);
  const bool pooled{params_.pooling_mode != PoolingMode_t::None};

  LookupOutput output;
  output.type = params_.output_type;
  output.num_rows = 0;
  output.row_size_in_bytes = 0;
  // First output row of each table when unpooled.
  std::vector<size_t> row_bases(tables_.size(), 0);
  if (pooled) {
    output.num_rows = batches.front().num_bags();
    for (const EmbeddingTable& table : tables_) {
      const size_t dim{table.spec().embedding_dim};
      output.segment_offsets.push_back(output.row_size_in_bytes);
      output.segment_dims.push_back(dim);
      output.row_size_in_bytes += quantizer_.segment_size_in_bytes(dim);
    }
  } else {
    const size_t dim{tables_.front().spec().embedding_dim};
    output.segment_offsets.push_back(0);
    output.segment_dims.push_back(dim);
    output.row_size_in_bytes = quantizer_.segment_size_in_bytes(dim);
    for (size_t t = 0; t < batches.size(); ++t) {
      row_bases[t] = output.num_rows;
      output.num_rows += batches[t].indices.size();
    }
  }
  output.bytes.resize(output.num_rows * output.row_size_in_bytes);

  std::vector<std::shared_lock<std::shared_mutex>> locks;
  locks.reserve(table_guards_.size());
  for (std::shared_mutex& guard : table_guards_) {
    locks.emplace_back(guard);
  }

  const size_t stride{output.row_size_in_bytes};
  std::vector<std::future<void>> results;
  for (size_t t = 0; t < batches.size(); ++t) {
    const TableBatch<TypeIndex>& batch{batches[t]};
    if (batch.num_bags() == 0) {
      continue;
    }
    uint8_t* const out{output.bytes.data() +
                       (pooled ? output.segment_offsets[t] : row_bases[t] * stride)};
    for (size_t first = 0; first < batch.num_bags(); first += params_.max_bags_per_task) {
      const size_t last{std::min(first + params_.max_bags_per_task, batch.num_bags())};
      results.emplace_back(pool_.submit([this, t, &batch, first, last, out, stride]() {
        lookup_bags(t, batch, first, last, out, stride);
      }));
    }
  }
  ThreadPool::await(results.begin(), results.end());

  QEMB_LOG_C(TRACE, ROOT, "Looked up ", batches.size(), " tables in ", results.size(),
             " tasks, ", output.num_rows, " output rows.\n");
  return output;
}

template LookupOutput LookupEngine::forward(const std::vector<TableBatch<int32_t>>& batches);
template LookupOutput LookupEngine::forward(const std::vector<TableBatch<int64_t>>& batches);

void LookupEngine::assign_row(const size_t table, const int64_t row, const uint8_t* const bytes,
                              const size_t num_bytes) {
  check_table(table);
  EmbeddingTable& target{tables_[table]};
  const TableSpec& spec{target.spec()};

  const std::unique_lock<std::shared_mutex> lock(table_guards_[table]);
  target.assign_row(row, bytes, num_bytes);
  if (cached_[table]) {
    std::vector<float> values(spec.embedding_dim);
    codec_.decode(bytes, num_bytes, spec.embedding_dim, spec.weight_type, values.data());
    cache_->update(spec.table_id, row, spec.embedding_dim, values.data());
  }
}

void LookupEngine::assign_table_weights(const size_t table, const uint8_t* const bytes,
                                        const size_t num_bytes) {
  check_table(table);
  EmbeddingTable& target{tables_[table]};
  const TableSpec& spec{target.spec()};

  const std::unique_lock<std::shared_mutex> lock(table_guards_[table]);
  target.assign_weights(bytes, num_bytes);
  if (cached_[table]) {
    cache_->invalidate_table(spec.table_id);
  }
  QEMB_LOG_C(DEBUG, ROOT, "Replaced weights of table '", spec.name, "' (", num_bytes,
             " bytes).\n");
}

CacheStats LookupEngine::cache_stats() const {
  if (!cache_) {
    return {0, 0, 0};
  }
  return cache_->get_stats();
}

void LookupEngine::reset_cache() {
  if (cache_) {
    cache_->reset();
    cache_->reset_stats();
  }
}

size_t LookupEngine::total_output_width() const {
  if (params_.pooling_mode == PoolingMode_t::None) {
    return quantizer_.segment_size_in_bytes(tables_.front().spec().embedding_dim);
  }
  size_t width{0};
  for (const EmbeddingTable& table : tables_) {
    width += quantizer_.segment_size_in_bytes(table.spec().embedding_dim);
  }
  return width;
}

}  // namespace QEmbed
