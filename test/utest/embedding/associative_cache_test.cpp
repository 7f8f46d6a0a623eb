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

#include <atomic>
#include <embedding/associative_cache.hpp>
#include <random>
#include <stdexcept>
#include <thread_pool.hpp>
#include <utest/test_utils.h>
#include <vector>

using namespace QEmbed;

namespace {

constexpr size_t dim{8};

float expected_value(const size_t table_id, const int64_t row, const size_t j) {
  return static_cast<float>(table_id * 100000 + row * 10 + j);
}

AssociativeCache::FetchFn make_fetch(const size_t table_id, const int64_t row,
                                     std::atomic<size_t>* num_fetches = nullptr) {
  return [=](float* out) {
    if (num_fetches) {
      ++*num_fetches;
    }
    for (size_t j = 0; j < dim; ++j) {
      out[j] = expected_value(table_id, row, j);
    }
  };
}

bool access(AssociativeCache& cache, const size_t table_id, const int64_t row) {
  std::vector<float> out(dim);
  const bool hit = cache.get_or_fetch(table_id, row, dim, make_fetch(table_id, row), out.data());
  for (size_t j = 0; j < dim; ++j) {
    EXPECT_EQ(out[j], expected_value(table_id, row, j));
  }
  return hit;
}

// A single set, so every row competes for the same ways.
AssociativeCacheParams single_set(const CacheAlgorithm_t algorithm, const size_t associativity) {
  return AssociativeCacheParams(algorithm, associativity, associativity, 0, dim);
}

void concurrent_access_test(const CacheAlgorithm_t algorithm, const size_t associativity) {
  AssociativeCache cache{AssociativeCacheParams(algorithm, associativity, 64, 0, dim)};
  ThreadPool pool("cache_test", 8);

  std::atomic<size_t> num_errors{0};
  std::vector<std::future<void>> results;
  for (size_t t = 0; t < 8; ++t) {
    results.emplace_back(pool.submit([&cache, &num_errors, t]() {
      std::mt19937 gen(static_cast<unsigned>(t));
      std::uniform_int_distribution<int64_t> row_dist(0, 255);
      std::vector<float> out(dim);
      for (size_t i = 0; i < 2000; ++i) {
        const size_t table_id = i % 3;
        const int64_t row = row_dist(gen);
        cache.get_or_fetch(table_id, row, dim, make_fetch(table_id, row), out.data());
        for (size_t j = 0; j < dim; ++j) {
          if (out[j] != expected_value(table_id, row, j)) {
            ++num_errors;
          }
        }
      }
    }));
  }
  ThreadPool::await(results.begin(), results.end());

  EXPECT_EQ(num_errors.load(), 0);
  EXPECT_LE(cache.size(), cache.capacity());
  const CacheStats stats = cache.get_stats();
  EXPECT_EQ(stats.hits + stats.misses, 8 * 2000);
}

}  // namespace

TEST(associative_cache, geometry) {
  const AssociativeCache by_rows{AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 10, 0, dim)};
  EXPECT_EQ(by_rows.num_sets(), 3);
  EXPECT_EQ(by_rows.associativity(), 4);
  EXPECT_EQ(by_rows.capacity(), 12);

  const AssociativeCache by_bytes{
      AssociativeCacheParams(CacheAlgorithm_t::LFU, 4, 0, 16 * dim * sizeof(float), dim)};
  EXPECT_EQ(by_bytes.num_sets(), 4);

  const AssociativeCache tiny{AssociativeCacheParams(CacheAlgorithm_t::LRU, 32, 1, 0, dim)};
  EXPECT_EQ(tiny.num_sets(), 1);

  for (int64_t row = 0; row < 1000; ++row) {
    EXPECT_LT(by_rows.set_index(1, row), by_rows.num_sets());
    EXPECT_EQ(by_rows.set_index(1, row), by_rows.set_index(1, row));
  }

  EXPECT_EQ(test::thrown_error([] {
              AssociativeCache cache{AssociativeCacheParams(CacheAlgorithm_t::LRU, 0, 8, 0, dim)};
            }),
            Error_t::WrongInput);
  EXPECT_EQ(test::thrown_error([] {
              AssociativeCache cache{AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 0, 4, dim)};
            }),
            Error_t::WrongInput);
  EXPECT_EQ(test::thrown_error([] {
              AssociativeCache cache{AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 8, 0, 0)};
            }),
            Error_t::WrongInput);
}

TEST(associative_cache, hit_and_miss_return_identical_rows) {
  AssociativeCache cache{AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 64, 0, dim)};
  std::atomic<size_t> num_fetches{0};
  std::vector<float> miss(dim), hit(dim);

  EXPECT_FALSE(cache.get_or_fetch(2, 17, dim, make_fetch(2, 17, &num_fetches), miss.data()));
  EXPECT_TRUE(cache.get_or_fetch(2, 17, dim, make_fetch(2, 17, &num_fetches), hit.data()));
  EXPECT_EQ(num_fetches.load(), 1);
  EXPECT_EQ(miss, hit);

  const CacheStats stats = cache.get_stats();
  EXPECT_EQ(stats.hits, 1);
  EXPECT_EQ(stats.misses, 1);
  EXPECT_EQ(stats.evictions, 0);
  cache.reset_stats();
  EXPECT_EQ(cache.get_stats().hits, 0);
}

TEST(associative_cache, lru_evicts_least_recently_used) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LRU, 4)};
  for (int64_t row = 0; row < 4; ++row) {
    EXPECT_FALSE(access(cache, 0, row));
  }
  EXPECT_TRUE(access(cache, 0, 0));

  EXPECT_FALSE(access(cache, 0, 4));
  EXPECT_FALSE(cache.contains(0, 1));
  EXPECT_TRUE(cache.contains(0, 0));

  EXPECT_FALSE(access(cache, 0, 5));
  EXPECT_FALSE(cache.contains(0, 2));
  EXPECT_TRUE(cache.contains(0, 3));
  EXPECT_EQ(cache.size(), 4);
  EXPECT_EQ(cache.get_stats().evictions, 2);
}

TEST(associative_cache, lfu_evicts_least_frequently_used) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LFU, 4)};
  for (int64_t row = 0; row < 4; ++row) {
    access(cache, 0, row);
  }
  // Access counts: row 0 -> 3, row 1 -> 2, row 2 -> 2, row 3 -> 1.
  access(cache, 0, 0);
  access(cache, 0, 0);
  access(cache, 0, 1);
  access(cache, 0, 2);

  EXPECT_FALSE(access(cache, 0, 4));
  EXPECT_FALSE(cache.contains(0, 3));
  EXPECT_TRUE(cache.contains(0, 0));
  EXPECT_TRUE(cache.contains(0, 1));
  EXPECT_TRUE(cache.contains(0, 2));
}

TEST(associative_cache, lfu_breaks_ties_by_recency) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LFU, 3)};
  access(cache, 0, 0);
  access(cache, 0, 1);
  access(cache, 0, 2);
  access(cache, 0, 1);

  // Rows 0 and 2 were both used once; row 0 is older.
  access(cache, 0, 3);
  EXPECT_FALSE(cache.contains(0, 0));
  EXPECT_TRUE(cache.contains(0, 2));

  // Rows 2 and 3 were both used once; row 2 is older.
  access(cache, 0, 4);
  EXPECT_FALSE(cache.contains(0, 2));
  EXPECT_TRUE(cache.contains(0, 3));
  EXPECT_TRUE(cache.contains(0, 1));
}

TEST(associative_cache, direct_mapped_replaces_resident) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LRU, 1)};
  EXPECT_FALSE(access(cache, 0, 7));
  EXPECT_TRUE(access(cache, 0, 7));
  EXPECT_FALSE(access(cache, 0, 8));
  EXPECT_FALSE(cache.contains(0, 7));
  EXPECT_TRUE(cache.contains(0, 8));
  EXPECT_EQ(cache.size(), 1);

  AssociativeCache lfu{single_set(CacheAlgorithm_t::LFU, 1)};
  access(lfu, 0, 7);
  access(lfu, 0, 7);
  access(lfu, 0, 7);
  EXPECT_FALSE(access(lfu, 0, 8));
  EXPECT_TRUE(lfu.contains(0, 8));
}

TEST(associative_cache, table_id_is_part_of_the_key) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LRU, 2)};
  EXPECT_FALSE(access(cache, 0, 5));
  EXPECT_FALSE(access(cache, 1, 5));
  EXPECT_TRUE(access(cache, 0, 5));
  EXPECT_TRUE(access(cache, 1, 5));
  EXPECT_EQ(cache.size(), 2);

  AssociativeCache many_sets{AssociativeCacheParams(CacheAlgorithm_t::LRU, 2, 1024, 0, dim)};
  size_t num_distinct{0};
  for (int64_t row = 0; row < 64; ++row) {
    num_distinct += many_sets.set_index(0, row) != many_sets.set_index(1, row) ? 1 : 0;
  }
  EXPECT_GT(num_distinct, 0);
}

TEST(associative_cache, update_and_invalidate) {
  AssociativeCache cache{AssociativeCacheParams(CacheAlgorithm_t::LRU, 4, 64, 0, dim)};
  access(cache, 0, 1);
  access(cache, 0, 2);
  access(cache, 1, 1);

  std::vector<float> values(dim, -3.f);
  EXPECT_TRUE(cache.update(0, 1, dim, values.data()));
  EXPECT_FALSE(cache.update(0, 3, dim, values.data()));
  EXPECT_FALSE(cache.contains(0, 3));

  std::vector<float> out(dim);
  std::atomic<size_t> num_fetches{0};
  EXPECT_TRUE(cache.get_or_fetch(0, 1, dim, make_fetch(0, 1, &num_fetches), out.data()));
  EXPECT_EQ(out, values);
  EXPECT_EQ(num_fetches.load(), 0);

  EXPECT_TRUE(cache.invalidate(0, 1));
  EXPECT_FALSE(cache.invalidate(0, 1));
  EXPECT_FALSE(cache.get_or_fetch(0, 1, dim, make_fetch(0, 1, &num_fetches), out.data()));
  EXPECT_EQ(num_fetches.load(), 1);
  EXPECT_EQ(out[0], expected_value(0, 1, 0));

  EXPECT_EQ(cache.invalidate_table(0), 2);
  EXPECT_FALSE(cache.contains(0, 2));
  EXPECT_TRUE(cache.contains(1, 1));

  cache.reset();
  EXPECT_EQ(cache.size(), 0);
}

TEST(associative_cache, failed_fetch_keeps_set_intact) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LRU, 1)};
  access(cache, 0, 1);

  std::vector<float> out(dim);
  EXPECT_THROW(cache.get_or_fetch(0, 2, dim,
                                  [](float*) { throw std::runtime_error("backing store"); },
                                  out.data()),
               std::runtime_error);
  EXPECT_TRUE(cache.contains(0, 1));
  EXPECT_FALSE(cache.contains(0, 2));
}

TEST(associative_cache, rejects_oversized_rows) {
  AssociativeCache cache{single_set(CacheAlgorithm_t::LRU, 2)};
  std::vector<float> out(2 * dim);
  EXPECT_EQ(test::thrown_error([&] {
              cache.get_or_fetch(0, 1, 2 * dim, make_fetch(0, 1), out.data());
            }),
            Error_t::OutOfBound);
}

TEST(associative_cache, concurrent_lru_4) { concurrent_access_test(CacheAlgorithm_t::LRU, 4); }
TEST(associative_cache, concurrent_lfu_4) { concurrent_access_test(CacheAlgorithm_t::LFU, 4); }
TEST(associative_cache, concurrent_direct_mapped) {
  concurrent_access_test(CacheAlgorithm_t::LRU, 1);
}
