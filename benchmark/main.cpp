
#include "pcollections/persistent-list.hpp"
#include "pcollections/persistent-map.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace std::string_literals;

using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

static ticktock_type tick() { return std::chrono::steady_clock::now(); }
static std::chrono::microseconds tock(const ticktock_type& whence) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now - whence);
}

constexpr std::size_t n_columns = 5;

struct Data {
  std::string label;
  std::size_t size;
  std::array<std::string, n_columns> columns;
  std::array<uint64_t, n_columns> insert_times;
  std::array<uint64_t, n_columns> iterate_times;
  std::array<uint64_t, n_columns> find_times;
  std::array<uint64_t, n_columns> delete_times;
  std::size_t volatile_data = 0; // to prevent optimizing away
};

template <typename T> T generate(std::size_t counter) {
  static_assert(std::is_integral<T>::value || std::is_same<T, std::string>::value);
  if constexpr (std::is_integral<T>::value) {
    return static_cast<T>(counter);
  } else {
    return fmt::format("{0}:{1}:{0}:{2}", counter, 10 * counter, 437 * counter * 12345667);
  }
}

template <typename key_type, typename value_type>
std::vector<std::pair<key_type, value_type>> generate_items(std::size_t count) {
  std::vector<std::pair<key_type, value_type>> items;
  items.reserve(count);
  for (auto i = 0u; i < count; ++i)
    items.push_back({generate<key_type>(i), generate<value_type>(i)});
  return items;
}

/**
 * Times each operation on:
 *  1. unordered_map (with reserve)
 *  2. unordered_map (without reserve)
 *  3. persistent_map (atomic reference counts), one edit at a time
 *  4. persistent_map (plain reference counts), one edit at a time
 *  5. persistent_map (atomic reference counts), edited in a transient session
 */
template <typename key_type, typename value_type>
Data run_items(std::string label, const std::size_t size, const uint32_t sample_size) {
  using item_type = std::pair<key_type, value_type>;
  using persistent_map_type = pcollections::persistent_map<key_type, value_type>;
  using non_atomic_persistent_map_type =
      pcollections::persistent_map<key_type, value_type, std::hash<key_type>,
                                   std::equal_to<key_type>, false>;
  using std_map_type = std::unordered_map<key_type, value_type>;

  const std::vector<item_type> items = generate_items<key_type, value_type>(size);

  Data data;
  data.label = label;
  data.size = size;
  data.columns = decltype(data.columns){
      {"std-map-reserve"s, "std-map"s, "atomic-trie"s, "na-trie"s, "transient"s}};

  std_map_type std_map_w_res;
  std_map_type std_map_wo_res;
  persistent_map_type atomic_trie;
  non_atomic_persistent_map_type non_atomic_trie;
  persistent_map_type batch_trie;

  std_map_w_res.reserve(size);

  auto profile = [sample_size](std::string_view label, auto thunk) {
    uint64_t total_us = 0;
    for (auto i = 0u; i < sample_size; ++i) {
      const auto reference = tick();
      thunk();
      total_us += tock(reference).count();
    }
    const auto average_us = uint64_t(total_us / double(sample_size));
    std::cout << fmt::format("             {:15s} = {}.{:06d}s\n", label, average_us / 1000000,
                             average_us % 1000000);
    return average_us;
  };

  // One edit at a time, so that every insert publishes a new version
  auto insert_one_by_one = [&items](auto& map) {
    for (const auto& item : items)
      map.insert(item);
  };

  { // Insert
    std::cout << fmt::format("{}({}) -- INSERT\n", label, size);
    data.insert_times[0] = profile(data.columns[0], [&]() {
      std_map_w_res.insert(std::begin(items), std::end(items));
    });
    data.insert_times[1] = profile(data.columns[1], [&]() {
      std_map_wo_res.insert(std::begin(items), std::end(items));
    });
    data.insert_times[2] = profile(data.columns[2], [&]() { insert_one_by_one(atomic_trie); });
    data.insert_times[3] = profile(data.columns[3], [&]() { insert_one_by_one(non_atomic_trie); });
    data.insert_times[4] = profile(data.columns[4], [&]() {
      auto session = batch_trie.transient();
      for (const auto& item : items)
        session.insert(item);
      batch_trie = session.persistent();
    });
  }

  { // Iterate
    std::cout << fmt::format("{}({}) -- ITERATE\n", label, size);
    std::size_t counter = 0;
    auto iterate = [&counter](const auto& map) {
      for (const auto& item : map)
        counter += static_cast<std::size_t>(item.second);
    };
    data.iterate_times[0] = profile(data.columns[0], [&]() { iterate(std_map_w_res); });
    data.iterate_times[1] = profile(data.columns[1], [&]() { iterate(std_map_wo_res); });
    data.iterate_times[2] = profile(data.columns[2], [&]() { iterate(atomic_trie); });
    data.iterate_times[3] = profile(data.columns[3], [&]() { iterate(non_atomic_trie); });
    data.iterate_times[4] = profile(data.columns[4], [&]() { iterate(batch_trie); });
    data.volatile_data += counter;
  }

  { // Find
    std::cout << fmt::format("{}({}) -- FIND\n", label, size);
    std::size_t counter = 0;
    auto find_all = [&](const auto& map) {
      for (const auto& item : items)
        counter += static_cast<std::size_t>(map.find(item.first) != nullptr);
    };
    data.find_times[0] = profile(data.columns[0], [&]() {
      for (const auto& item : items)
        counter += static_cast<std::size_t>(std_map_w_res.at(item.first));
    });
    data.find_times[1] = profile(data.columns[1], [&]() {
      for (const auto& item : items)
        counter += static_cast<std::size_t>(std_map_wo_res.at(item.first));
    });
    data.find_times[2] = profile(data.columns[2], [&]() { find_all(atomic_trie); });
    data.find_times[3] = profile(data.columns[3], [&]() { find_all(non_atomic_trie); });
    data.find_times[4] = profile(data.columns[4], [&]() { find_all(batch_trie); });
    data.volatile_data += counter;
  }

  { // Delete
    std::cout << fmt::format("{}({}) -- DELETE\n", label, size);
    auto erase_all = [&items](auto& map) {
      for (const auto& item : items)
        map.erase(item.first);
    };
    data.delete_times[0] = profile(data.columns[0], [&]() { erase_all(std_map_w_res); });
    data.delete_times[1] = profile(data.columns[1], [&]() { erase_all(std_map_wo_res); });
    data.delete_times[2] = profile(data.columns[2], [&]() { erase_all(atomic_trie); });
    data.delete_times[3] = profile(data.columns[3], [&]() { erase_all(non_atomic_trie); });
    data.delete_times[4] = profile(data.columns[4], [&]() {
      auto session = batch_trie.transient();
      for (const auto& item : items)
        session.erase(item.first);
      batch_trie = session.persistent();
    });
  }

  std::cout << "\n";

  return data;
}

/**
 * Appending to a persistent list, then popping from alternate ends
 */
void run_list(std::ostream& os, std::size_t size0, std::size_t max_size) {
  os << "list\tpush_back\tindex\tpop\n";
  for (std::size_t size = size0; size <= max_size; size *= 2) {
    pcollections::persistent_list<int> list;
    std::size_t counter = 0;

    const auto push_start = tick();
    for (auto i = 0u; i < size; ++i)
      list.push_back(static_cast<int>(i));
    const auto push_us = tock(push_start).count();

    const auto index_start = tick();
    for (auto i = 0u; i < size; ++i)
      counter += static_cast<std::size_t>(list[static_cast<int64_t>(i)]);
    const auto index_us = tock(index_start).count();

    const auto pop_start = tick();
    while (!list.empty()) {
      if (list.size() % 2 == 0)
        list.pop_front();
      else
        list.pop_back();
    }
    const auto pop_us = tock(pop_start).count();

    std::cout << fmt::format("list({}) -- push {}us, index {}us, pop {}us [{}]\n", size, push_us,
                             index_us, pop_us, counter % 10);
    os << fmt::format("{}\t{}\t{}\t{}\n", size, push_us, index_us, pop_us);
  }
  os << "\n";
}

template <typename key_type, typename value_type>
void run_types(std::ostream& os, std::string label, std::size_t size0, std::size_t max_size,
               uint32_t sample_size) {
  std::vector<Data> data;
  for (std::size_t size = size0; size <= max_size; size *= 2)
    data.push_back(run_items<key_type, value_type>(label, size, sample_size));

  auto output = [&](std::string op_type, auto fn) {
    os << fmt::format("{}_{}\t{}\n", label, op_type, fmt::join(data[0].columns, "\t"));
    for (const auto& datum : data)
      os << fmt::format("{}\t{}\n", datum.size, fmt::join(fn(datum), "\t"));
    os << "\n";
  };

  output("insert", std::mem_fn(&Data::insert_times));
  output("iterate", std::mem_fn(&Data::iterate_times));
  output("find", std::mem_fn(&Data::find_times));
  output("delete", std::mem_fn(&Data::delete_times));
}

void run_benchmark(std::string filename, std::size_t max_size) {
  const std::size_t min_size = 1000;
  const uint32_t sample_size = 20;
  std::fstream file(filename, file.out);
  if (!file.is_open()) {
    std::cerr << fmt::format("failed to open file '{}'\n", filename);
    std::exit(1);
  }

  run_types<int, int>(file, "integer", min_size, max_size, sample_size);
  run_types<std::string, int>(file, "string", min_size, max_size, sample_size);
  run_list(file, min_size, max_size);

  file.close();
  std::cout << fmt::format("Benchmark results collated in '{}'\n", filename);
}

int main(int argc, char* argv[]) {
  const std::string filename = (argc > 1) ? argv[1] : "/tmp/benchmark-data.csv";
  const std::size_t max_size = (argc > 2) ? std::strtoull(argv[2], nullptr, 10) : 2000000;
  run_benchmark(filename, max_size);
  return EXIT_SUCCESS;
}
