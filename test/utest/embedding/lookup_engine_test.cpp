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

#include <gtest/gtest.h>

#include <embedding/lookup_engine.hpp>
#include <future>
#include <thread_pool.hpp>
#include <utest/test_utils.h>
#include <vector>

using namespace QEmbed;

namespace {

constexpr size_t num_rows{100};

uint32_t max_code(const SparseType_t type) {
  switch (type) {
    case SparseType_t::INT4:
      return 15;
    case SparseType_t::INT2:
      return 3;
    case SparseType_t::FP8:
      return 15;
    default:
      return 255;
  }
}

// Every stored value is a small integer, so all formats hold it exactly.
float stored_value(const TableSpec& spec, const int64_t row, const size_t j) {
  return static_cast<float>((row + j + 7 * spec.table_id) % (max_code(spec.weight_type) + 1));
}

Row make_row(const TableSpec& spec, const int64_t row) {
  const size_t dim{spec.embedding_dim};
  std::vector<float> values(dim);
  for (size_t j = 0; j < dim; ++j) {
    values[j] = stored_value(spec, row, j);
  }
  if (RowCodec::has_scale_bias(spec.weight_type)) {
    const std::vector<uint8_t> codes(values.begin(), values.end());
    return RowCodec::encode_quantized(codes.data(), dim, spec.weight_type, 1.f, 0.f);
  }
  return RowCodec().encode(values.data(), dim, spec.weight_type);
}

void load_tables(LookupEngine& engine) {
  for (size_t t = 0; t < engine.num_tables(); ++t) {
    const TableSpec& spec{engine.get_table(t).spec()};
    std::vector<uint8_t> weights;
    for (size_t r = 0; r < spec.num_rows; ++r) {
      const Row row{make_row(spec, static_cast<int64_t>(r))};
      weights.insert(weights.end(), row.begin(), row.end());
    }
    engine.assign_table_weights(t, weights);
  }
}

template <typename TypeIndex>
TableBatch<TypeIndex> make_batch(const size_t table_id, const std::vector<TypeIndex>& offsets,
                                 const std::vector<TypeIndex>& indices,
                                 const std::vector<float>& weights = {}) {
  return TableBatch<TypeIndex>{table_id, offsets, indices, weights};
}

int64_t physical_row(const LookupEngineParams& params, const size_t t, const int64_t index) {
  if (params.index_remappings.empty() || params.index_remappings[t].empty()) {
    return index;
  }
  return params.index_remappings[t][index];
}

// Pooled result computed row by row, in the order the engine accumulates.
template <typename TypeIndex>
std::vector<float> reference_pooled(const LookupEngineParams& params,
                                    const std::vector<TableBatch<TypeIndex>>& batches) {
  size_t total_dim{0};
  for (const TableSpec& spec : params.tables) {
    total_dim += spec.embedding_dim;
  }
  const size_t num_bags{batches.front().num_bags()};
  std::vector<float> expected(num_bags * total_dim, 0.f);

  size_t column{0};
  for (size_t t = 0; t < params.tables.size(); ++t) {
    const TableSpec& spec{params.tables[t]};
    const TableBatch<TypeIndex>& batch{batches[t]};
    for (size_t b = 0; b < num_bags; ++b) {
      float* const out{&expected[b * total_dim + column]};
      size_t count{0};
      for (TypeIndex i = batch.offsets[b]; i < batch.offsets[b + 1]; ++i) {
        const int64_t row{physical_row(params, t, batch.indices[i])};
        if (row < 0) {
          continue;
        }
        const float weight{batch.per_sample_weights.empty() ? 1.f : batch.per_sample_weights[i]};
        for (size_t j = 0; j < spec.embedding_dim; ++j) {
          out[j] += weight * stored_value(spec, row, j);
        }
        ++count;
      }
      if (params.pooling_mode == PoolingMode_t::Mean && count > 0) {
        for (size_t j = 0; j < spec.embedding_dim; ++j) {
          out[j] /= static_cast<float>(count);
        }
      }
    }
    column += spec.embedding_dim;
  }
  return expected;
}

LookupEngineParams single_table_params(const PoolingMode_t pooling_mode,
                                       const SparseType_t output_type = SparseType_t::FP32) {
  LookupEngineParams params(
      std::vector<TableSpec>{TableSpec(0, "t0", num_rows, 32, SparseType_t::INT8)});
  params.pooling_mode = pooling_mode;
  params.output_type = output_type;
  params.num_workers = 2;
  return params;
}

template <typename TypeIndex>
void sum_lookup_test() {
  LookupEngine engine(single_table_params(PoolingMode_t::Sum));
  load_tables(engine);

  const LookupOutput output{
      engine.forward(std::vector<TableBatch<TypeIndex>>{make_batch<TypeIndex>(0, {0, 3, 5},
                                                                              {4, 4, 4, 10, 20})})};
  ASSERT_EQ(output.num_rows, 2);
  ASSERT_EQ(output.num_segments(), 1);
  ASSERT_EQ(output.row_size_in_bytes, 32 * sizeof(float));
  EXPECT_EQ(output.row_size_in_bytes, engine.total_output_width());

  const std::vector<float> values{output.dequantize()};
  for (size_t j = 0; j < 32; ++j) {
    EXPECT_EQ(values[j], static_cast<float>(3 * (4 + j)));
    EXPECT_EQ(values[32 + j], static_cast<float>((10 + j) + (20 + j)));
  }
}

template <typename TypeIndex>
void unpooled_lookup_test() {
  LookupEngine engine(single_table_params(PoolingMode_t::None));
  load_tables(engine);

  const std::vector<TypeIndex> indices{4, 4, 4, 10, 20};
  const LookupOutput output{engine.forward(
      std::vector<TableBatch<TypeIndex>>{make_batch<TypeIndex>(0, {0, 3, 5}, indices)})};
  ASSERT_EQ(output.num_rows, indices.size());

  const std::vector<float> values{output.dequantize()};
  for (size_t i = 0; i < indices.size(); ++i) {
    for (size_t j = 0; j < 32; ++j) {
      EXPECT_EQ(values[i * 32 + j], static_cast<float>(indices[i] + j));
    }
  }
}

// Logical row i is stored at 99 - i, except for multiples of 3, which are pruned.
std::vector<int32_t> pruning_remapping() {
  std::vector<int32_t> remapping(num_rows);
  for (size_t i = 0; i < num_rows; ++i) {
    remapping[i] = i % 3 == 0 ? PRUNED_ROW : static_cast<int32_t>(num_rows - 1 - i);
  }
  return remapping;
}

void mean_with_pruning_test(const IndexRemapping_t remapping_type) {
  LookupEngineParams params{single_table_params(PoolingMode_t::Mean)};
  params.remapping_type = remapping_type;
  params.index_remappings = {pruning_remapping()};
  LookupEngine engine(params);
  load_tables(engine);

  // Bag 0 is entirely pruned, bag 1 keeps one row, bag 2 keeps both.
  const std::vector<TableBatch<int32_t>> batches{
      make_batch<int32_t>(0, {0, 3, 5, 7}, {0, 3, 6, 1, 3, 2, 4})};
  const std::vector<float> values{engine.forward(batches).dequantize()};
  ASSERT_EQ(values.size(), 3 * 32);
  for (size_t j = 0; j < 32; ++j) {
    EXPECT_EQ(values[j], 0.f);
    EXPECT_EQ(values[32 + j], static_cast<float>(98 + j));
    EXPECT_EQ(values[64 + j], static_cast<float>(96 + j));
  }
  EXPECT_EQ(values, reference_pooled(params, batches));
}

void unpooled_pruning_test() {
  LookupEngineParams params{single_table_params(PoolingMode_t::None)};
  params.index_remappings = {pruning_remapping()};
  LookupEngine engine(params);
  load_tables(engine);

  const std::vector<float> values{
      engine.forward(std::vector<TableBatch<int64_t>>{make_batch<int64_t>(0, {0, 2}, {3, 5})})
          .dequantize()};
  ASSERT_EQ(values.size(), 2 * 32);
  for (size_t j = 0; j < 32; ++j) {
    EXPECT_EQ(values[j], 0.f);
    EXPECT_EQ(values[32 + j], static_cast<float>(94 + j));
  }
}

void hash_index_width_test() {
  LookupEngineParams params{single_table_params(PoolingMode_t::Sum)};
  params.remapping_type = IndexRemapping_t::Hash;
  params.index_remappings = {pruning_remapping()};
  LookupEngine engine(params);

  EXPECT_EQ(test::thrown_error([&]() {
              engine.forward(
                  std::vector<TableBatch<int64_t>>{make_batch<int64_t>(0, {0, 1}, {1})});
            }),
            Error_t::UnsupportedIndexWidth);
  EXPECT_EQ(test::thrown_error([&]() {
              engine.forward(
                  std::vector<TableBatch<int32_t>>{make_batch<int32_t>(0, {0, 1}, {1})});
            }),
            Error_t::Success);
}

void weighted_sum_test() {
  LookupEngine engine(single_table_params(PoolingMode_t::Sum));
  load_tables(engine);

  const std::vector<TableBatch<int32_t>> batches{
      make_batch<int32_t>(0, {0, 2, 3}, {1, 2, 50}, {0.5f, 2.f, -1.f})};
  const std::vector<float> values{engine.forward(batches).dequantize()};
  for (size_t j = 0; j < 32; ++j) {
    EXPECT_EQ(values[j], 0.5f * (1 + j) + 2.f * (2 + j));
    EXPECT_EQ(values[32 + j], -static_cast<float>(50 + j));
  }
}

void mixed_dimensions_test() {
  LookupEngineParams params(std::vector<TableSpec>{
      TableSpec(0, "narrow", num_rows, 8, SparseType_t::INT4),
      TableSpec(1, "wide", 50, 16, SparseType_t::FP16),
      TableSpec(2, "bits", 20, 4, SparseType_t::INT2)});
  params.pooling_mode = PoolingMode_t::Sum;
  params.num_workers = 3;
  LookupEngine engine(params);
  load_tables(engine);

  const std::vector<TableBatch<int32_t>> batches{make_batch<int32_t>(0, {0, 2, 2}, {7, 99}),
                                                 make_batch<int32_t>(1, {0, 1, 3}, {0, 49, 1}),
                                                 make_batch<int32_t>(2, {0, 0, 1}, {19})};
  const LookupOutput output{engine.forward(batches)};
  EXPECT_EQ(output.num_rows, 2);
  EXPECT_EQ(output.segment_dims, (std::vector<size_t>{8, 16, 4}));
  EXPECT_EQ(output.segment_offsets, (std::vector<size_t>{0, 32, 96}));
  EXPECT_EQ(output.row_size_in_bytes, 112);
  EXPECT_EQ(engine.total_output_width(), 112);
  EXPECT_EQ(output.dequantize(), reference_pooled(params, batches));

  const std::vector<float> narrow{output.segment(0, 1)};
  for (size_t j = 0; j < 8; ++j) {
    EXPECT_EQ(narrow[j], 0.f);
  }
}

void output_type_test(const SparseType_t output_type) {
  LookupEngineParams params{single_table_params(PoolingMode_t::Sum, output_type)};
  LookupEngine engine(params);
  load_tables(engine);

  const std::vector<TableBatch<int32_t>> batches{
      make_batch<int32_t>(0, {0, 3, 5}, {4, 4, 4, 10, 20})};
  const LookupOutput output{engine.forward(batches)};
  EXPECT_EQ(output.type, output_type);
  EXPECT_EQ(output.row_size_in_bytes, OutputQuantizer::segment_size_in_bytes(32, output_type));

  const std::vector<float> expected{reference_pooled(params, batches)};
  const std::vector<float> values{output.dequantize()};
  ASSERT_EQ(values.size(), expected.size());
  if (output_type == SparseType_t::INT8) {
    // The largest bag spans [12, 105], so one code step is below 0.37.
    EXPECT_TRUE(test::compare_array_approx<float>(values.data(), expected.data(),
                                                  static_cast<int>(values.size()), 0.19f));
  } else {
    EXPECT_TRUE(test::compare_array_exact(values.data(), expected.data(),
                                          static_cast<int>(values.size())));
  }
}

void invalid_batches_test() {
  LookupEngineParams params(std::vector<TableSpec>{
      TableSpec(0, "t0", num_rows, 8), TableSpec(1, "t1", num_rows, 8),
      TableSpec(5, "t5", num_rows, 16)});
  params.pooling_mode = PoolingMode_t::Sum;
  params.num_workers = 2;
  LookupEngine engine(params);

  using Batches = std::vector<TableBatch<int32_t>>;
  const auto error_of = [&engine](const Batches& batches) {
    return test::thrown_error([&]() { engine.forward(batches); });
  };
  const auto valid = [](const size_t table_id) {
    return make_batch<int32_t>(table_id, {0, 1, 2}, {0, 1});
  };

  EXPECT_EQ(error_of({valid(0), valid(1), valid(5)}), Error_t::Success);
  EXPECT_EQ(error_of({valid(0), valid(1)}), Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(5), valid(1)}), Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {}, {})}), Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {1, 1, 2}, {0, 1})}),
            Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 2, 1}, {0, 1})}),
            Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 1, 3}, {0, 1})}),
            Error_t::WrongInput);
  // B differs across tables.
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 2}, {0, 1})}),
            Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 1, 2}, {0, 1}, {1.f})}),
            Error_t::WrongInput);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 1, 2}, {0, 100})}),
            Error_t::IndexOutOfRange);
  EXPECT_EQ(error_of({valid(0), valid(1), make_batch<int32_t>(5, {0, 1, 2}, {-1, 0})}),
            Error_t::IndexOutOfRange);
}

void invalid_pooling_test() {
  LookupEngine mean_engine(single_table_params(PoolingMode_t::Mean));
  EXPECT_EQ(test::thrown_error([&]() {
              mean_engine.forward(std::vector<TableBatch<int32_t>>{
                  make_batch<int32_t>(0, {0, 2}, {1, 2}, {1.f, 1.f})});
            }),
            Error_t::InvalidPoolingConfig);

  LookupEngine none_engine(single_table_params(PoolingMode_t::None));
  EXPECT_EQ(test::thrown_error([&]() {
              none_engine.forward(std::vector<TableBatch<int32_t>>{
                  make_batch<int32_t>(0, {0, 2}, {1, 2}, {1.f, 1.f})});
            }),
            Error_t::InvalidPoolingConfig);

  LookupEngineParams mixed(
      std::vector<TableSpec>{TableSpec(0, "t0", num_rows, 8), TableSpec(1, "t1", num_rows, 16)});
  mixed.pooling_mode = PoolingMode_t::None;
  mixed.num_workers = 1;
  LookupEngine mixed_engine(mixed);
  EXPECT_EQ(test::thrown_error([&]() {
              mixed_engine.forward(std::vector<TableBatch<int32_t>>{
                  make_batch<int32_t>(0, {0, 1}, {1}), make_batch<int32_t>(1, {0, 1}, {2})});
            }),
            Error_t::PoolingShape);

  // Unpooled batches may differ in B.
  LookupEngineParams same_dim(
      std::vector<TableSpec>{TableSpec(0, "t0", num_rows, 8), TableSpec(1, "t1", num_rows, 8)});
  same_dim.pooling_mode = PoolingMode_t::None;
  same_dim.num_workers = 1;
  LookupEngine same_dim_engine(same_dim);
  const LookupOutput output{same_dim_engine.forward(std::vector<TableBatch<int32_t>>{
      make_batch<int32_t>(0, {0, 1}, {1}), make_batch<int32_t>(1, {0, 1, 3}, {2, 3, 4})})};
  EXPECT_EQ(output.num_rows, 4);
}

void invalid_engine_test() {
  const LookupEngineParams no_tables(std::vector<TableSpec>{});
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(no_tables); }), Error_t::WrongInput);

  LookupEngineParams duplicate(
      std::vector<TableSpec>{TableSpec(3, "a", num_rows, 8), TableSpec(3, "b", num_rows, 8)});
  duplicate.num_workers = 1;
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(duplicate); }), Error_t::WrongInput);

  LookupEngineParams remappings{single_table_params(PoolingMode_t::Sum)};
  remappings.index_remappings = {pruning_remapping(), pruning_remapping()};
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(remappings); }), Error_t::WrongInput);

  LookupEngineParams output{single_table_params(PoolingMode_t::Sum, SparseType_t::INT4)};
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(output); }),
            Error_t::UnSupportedFormat);
}

// Random bags with empty bags and repeated rows.
template <typename TypeIndex>
std::vector<TableBatch<TypeIndex>> random_batches(const LookupEngineParams& params,
                                                  const size_t num_bags, const unsigned seed) {
  test::UniformDataSimulator simulator(seed);
  std::vector<TableBatch<TypeIndex>> batches;
  for (const TableSpec& spec : params.tables) {
    std::vector<int> bag_sizes(num_bags);
    simulator.fill(bag_sizes.data(), num_bags, 0, 6);
    std::vector<TypeIndex> offsets{0};
    for (const int bag_size : bag_sizes) {
      offsets.push_back(offsets.back() + bag_size);
    }
    std::vector<int> rows(static_cast<size_t>(offsets.back()));
    if (!rows.empty()) {
      simulator.fill(rows.data(), rows.size(), 0, static_cast<int>(spec.num_rows));
    }
    batches.push_back(
        make_batch<TypeIndex>(spec.table_id, offsets, std::vector<TypeIndex>(rows.begin(),
                                                                             rows.end())));
  }
  return batches;
}

LookupEngineParams cached_params(const bool with_cache) {
  LookupEngineParams params(std::vector<TableSpec>{
      TableSpec(0, "cached", num_rows, 16, SparseType_t::INT8,
                EmbeddingLocation_t::ManagedCaching),
      TableSpec(1, "host", num_rows, 8, SparseType_t::INT4, EmbeddingLocation_t::Host),
      TableSpec(2, "cached_fp8", num_rows, 4, SparseType_t::FP8,
                EmbeddingLocation_t::ManagedCaching)});
  params.pooling_mode = PoolingMode_t::Sum;
  params.num_workers = 4;
  params.max_bags_per_task = 3;
  if (with_cache) {
    params.cache = AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 32);
  }
  return params;
}

void cache_parity_test() {
  const LookupEngineParams params{cached_params(true)};
  LookupEngine cached(params);
  LookupEngine uncached(cached_params(false));
  load_tables(cached);
  load_tables(uncached);

  ASSERT_TRUE(cached.has_cache());
  EXPECT_FALSE(uncached.has_cache());
  EXPECT_TRUE(cached.is_cached(0));
  EXPECT_FALSE(cached.is_cached(1));
  EXPECT_TRUE(cached.is_cached(2));

  size_t num_cached_lookups{0};
  for (unsigned round = 0; round < 3; ++round) {
    const std::vector<TableBatch<int32_t>> batches{random_batches<int32_t>(params, 40, round)};
    num_cached_lookups += batches[0].indices.size() + batches[2].indices.size();

    const std::vector<float> expected{reference_pooled(params, batches)};
    EXPECT_EQ(cached.forward(batches).dequantize(), expected);
    EXPECT_EQ(uncached.forward(batches).dequantize(), expected);
  }

  const CacheStats stats{cached.cache_stats()};
  EXPECT_EQ(stats.hits + stats.misses, num_cached_lookups);
  EXPECT_GT(stats.hits, 0);
  EXPECT_GT(stats.evictions, 0);
  EXPECT_EQ(uncached.cache_stats().hits + uncached.cache_stats().misses, 0);

  cached.reset_cache();
  EXPECT_EQ(cached.cache_stats().hits + cached.cache_stats().misses, 0);
}

void concurrent_forward_test() {
  const LookupEngineParams params{cached_params(true)};
  LookupEngine engine(params);
  load_tables(engine);

  ThreadPool pool("forward_test", 4);
  std::vector<std::future<void>> results;
  for (unsigned t = 0; t < 8; ++t) {
    results.emplace_back(pool.submit([&engine, &params, t]() {
      const std::vector<TableBatch<int64_t>> batches{random_batches<int64_t>(params, 25, t)};
      const std::vector<float> expected{reference_pooled(params, batches)};
      for (size_t i = 0; i < 5; ++i) {
        if (engine.forward(batches).dequantize() != expected) {
          QEMB_OWN_THROW(Error_t::DataCheckError, "Concurrent lookup returned a wrong result.");
        }
      }
    }));
  }
  EXPECT_EQ(test::thrown_error([&]() { ThreadPool::await(results.begin(), results.end()); }),
            Error_t::Success);
}

void assign_row_visibility_test() {
  LookupEngineParams params{cached_params(true)};
  params.pooling_mode = PoolingMode_t::None;
  params.tables.erase(params.tables.begin() + 1, params.tables.end());
  LookupEngine engine(params);
  load_tables(engine);

  const std::vector<TableBatch<int32_t>> batches{make_batch<int32_t>(0, {0, 1}, {42})};
  EXPECT_EQ(engine.forward(batches).segment(0, 0)[0], stored_value(params.tables[0], 42, 0));

  // The row is resident now. Overwriting it must be visible to the next lookup.
  std::vector<uint8_t> codes(16, 7);
  engine.assign_row(0, 42, RowCodec::encode_quantized(codes.data(), 16, SparseType_t::INT8, 2.f,
                                                      1.f));
  const std::vector<float> updated{engine.forward(batches).segment(0, 0)};
  for (const float value : updated) {
    EXPECT_EQ(value, 15.f);
  }

  // Whole table replacement drops the cached rows of that table.
  load_tables(engine);
  EXPECT_EQ(engine.forward(batches).segment(0, 0)[3], stored_value(params.tables[0], 42, 3));

  EXPECT_EQ(test::thrown_error([&]() { engine.assign_row(0, 42, Row(3)); }),
            Error_t::FormatMismatch);
  EXPECT_EQ(test::thrown_error([&]() { engine.assign_row(1, 42, Row(20)); }),
            Error_t::OutOfBound);
}

// Unpooled lookups in the weight format return the stored rows, scale and bias included.
void raw_row_output_test(const SparseType_t type) {
  LookupEngineParams params(std::vector<TableSpec>{TableSpec(0, "t0", num_rows, 32, type)});
  params.pooling_mode = PoolingMode_t::None;
  params.output_type = type;
  params.num_workers = 2;
  params.index_remappings = {pruning_remapping()};
  LookupEngine engine(params);
  load_tables(engine);
  std::vector<uint8_t> codes(32);
  for (size_t j = 0; j < codes.size(); ++j) {
    codes[j] = static_cast<uint8_t>(j % 4);
  }
  const Row assigned{RowCodec::encode_quantized(codes.data(), 32, type, 0.5f, -3.f)};
  engine.assign_row(0, 91, assigned);

  const std::vector<int32_t> indices{4, 4, 4, 10, 20, 8, 3};
  const LookupOutput output{engine.forward(
      std::vector<TableBatch<int32_t>>{make_batch<int32_t>(0, {0, 3, 5, 7}, indices)})};
  ASSERT_EQ(output.type, type);
  ASSERT_EQ(output.num_rows, indices.size());
  ASSERT_EQ(output.row_size_in_bytes, RowCodec::row_size_in_bytes(32, type));

  const auto split{engine.get_table(0).split_weights()};
  const size_t payload{RowCodec::payload_size_in_bytes(32, type)};
  const size_t suffix{RowCodec::scale_bias_size_in_bytes(type)};
  // Index 3 is pruned and yields a zero row.
  for (size_t i = 0; i + 1 < indices.size(); ++i) {
    const size_t row{static_cast<size_t>(physical_row(params, 0, indices[i]))};
    const uint8_t* const out{output.row_data(i)};
    EXPECT_TRUE(test::compare_array_exact(out, &split.first[row * payload],
                                          static_cast<int>(payload)))
        << "index " << indices[i];
    EXPECT_TRUE(test::compare_array_exact(out + payload, &split.second[row * suffix],
                                          static_cast<int>(suffix)))
        << "index " << indices[i];
  }
  EXPECT_EQ(output.segment(0, 5), RowCodec().decode(assigned, 32, type));
  EXPECT_EQ(output.segment(0, indices.size() - 1), std::vector<float>(32, 0.f));
}

void sub_byte_output_test() {
  LookupEngineParams pooled(
      std::vector<TableSpec>{TableSpec(0, "t0", num_rows, 32, SparseType_t::INT4)});
  pooled.output_type = SparseType_t::INT4;
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(pooled); }),
            Error_t::UnSupportedFormat);

  LookupEngineParams other_weights(std::vector<TableSpec>{
      TableSpec(0, "t0", num_rows, 32, SparseType_t::INT4),
      TableSpec(1, "t1", num_rows, 32, SparseType_t::INT8)});
  other_weights.pooling_mode = PoolingMode_t::None;
  other_weights.output_type = SparseType_t::INT4;
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(other_weights); }),
            Error_t::UnSupportedFormat);

  LookupEngineParams fp8{single_table_params(PoolingMode_t::None, SparseType_t::FP8)};
  EXPECT_EQ(test::thrown_error([&]() { LookupEngine engine(fp8); }), Error_t::UnSupportedFormat);
}

void empty_batch_test(const PoolingMode_t pooling_mode) {
  LookupEngineParams params(std::vector<TableSpec>{
      TableSpec(0, "t0", num_rows, 8, SparseType_t::INT8), TableSpec(1, "t1", num_rows, 8)});
  params.pooling_mode = pooling_mode;
  params.output_type = SparseType_t::INT8;
  params.num_workers = 2;
  LookupEngine engine(params);
  load_tables(engine);

  const LookupOutput output{engine.forward(std::vector<TableBatch<int64_t>>{
      make_batch<int64_t>(0, {0}, {}), make_batch<int64_t>(1, {0}, {})})};
  EXPECT_EQ(output.num_rows, 0);
  EXPECT_TRUE(output.bytes.empty());
  EXPECT_TRUE(output.dequantize().empty());
}

// Pooled rows beyond the fp16 range still quantize to INT8, saturating at the fp16 limit.
void large_pooled_rows_test() {
  LookupEngineParams params{single_table_params(PoolingMode_t::Sum, SparseType_t::INT8)};
  params.tables = {TableSpec(0, "t0", num_rows, 8)};
  LookupEngine engine(params);

  std::vector<float> weights(num_rows * 8);
  for (size_t j = 0; j < 8; ++j) {
    weights[j] = -40000.f + 100.f * static_cast<float>(j);
    weights[5 * 8 + j] = static_cast<float>(j);
  }
  const Row bytes{RowCodec().encode(weights.data(), weights.size(), SparseType_t::FP32)};
  engine.assign_table_weights(0, bytes);

  const std::vector<TableBatch<int32_t>> batches{make_batch<int32_t>(0, {0, 3, 4}, {0, 0, 0, 5})};
  LookupOutput output;
  EXPECT_EQ(test::thrown_error([&]() { output = engine.forward(batches); }), Error_t::Success);
  ASSERT_EQ(output.num_rows, 2);

  EXPECT_EQ(output.segment(0, 0), std::vector<float>(8, -65504.f));
  const std::vector<float> small{output.segment(0, 1)};
  for (size_t j = 0; j < 8; ++j) {
    EXPECT_NEAR(small[j], static_cast<float>(j), 0.02f);
  }
}

}  // namespace

TEST(lookup_engine, sum_int32) { sum_lookup_test<int32_t>(); }
TEST(lookup_engine, sum_int64) { sum_lookup_test<int64_t>(); }
TEST(lookup_engine, unpooled_int32) { unpooled_lookup_test<int32_t>(); }
TEST(lookup_engine, unpooled_int64) { unpooled_lookup_test<int64_t>(); }
TEST(lookup_engine, mean_with_array_pruning) { mean_with_pruning_test(IndexRemapping_t::Array); }
TEST(lookup_engine, mean_with_hash_pruning) { mean_with_pruning_test(IndexRemapping_t::Hash); }
TEST(lookup_engine, unpooled_pruning) { unpooled_pruning_test(); }
TEST(lookup_engine, hash_index_width) { hash_index_width_test(); }
TEST(lookup_engine, weighted_sum) { weighted_sum_test(); }
TEST(lookup_engine, mixed_dimensions) { mixed_dimensions_test(); }
TEST(lookup_engine, fp16_output) { output_type_test(SparseType_t::FP16); }
TEST(lookup_engine, bf16_output) { output_type_test(SparseType_t::BF16); }
TEST(lookup_engine, int8_output) { output_type_test(SparseType_t::INT8); }
TEST(lookup_engine, invalid_batches) { invalid_batches_test(); }
TEST(lookup_engine, invalid_pooling) { invalid_pooling_test(); }
TEST(lookup_engine, invalid_engine) { invalid_engine_test(); }
TEST(lookup_engine, cache_parity) { cache_parity_test(); }
TEST(lookup_engine, concurrent_forward) { concurrent_forward_test(); }
TEST(lookup_engine, assign_row_visibility) { assign_row_visibility_test(); }
TEST(lookup_engine, raw_int8_rows) { raw_row_output_test(SparseType_t::INT8); }
TEST(lookup_engine, raw_int4_rows) { raw_row_output_test(SparseType_t::INT4); }
TEST(lookup_engine, raw_int2_rows) { raw_row_output_test(SparseType_t::INT2); }
TEST(lookup_engine, sub_byte_output) { sub_byte_output_test(); }
TEST(lookup_engine, empty_batch_sum) { empty_batch_test(PoolingMode_t::Sum); }
TEST(lookup_engine, empty_batch_unpooled) { empty_batch_test(PoolingMode_t::None); }
TEST(lookup_engine, large_pooled_rows) { large_pooled_rows_test(); }
