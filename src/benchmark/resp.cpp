#include <benchmark/benchmark.h>

#include <command_handler.hpp>
#include <resp.hpp>

#include <algorithm>
#include <array>
#include <iostream>
#include <memory>
#include <random>

namespace {

namespace ns = memkv::resp;

std::string random_chars(std::mt19937 &prng, int len, int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  std::string result(len, '\0');
  std::generate_n(result.begin(), len,
                  [&]() { return static_cast<char>(dist(prng)); });
  return result;
}

ns::frame random_frame(std::mt19937 &prng, int depth = 0) {
  std::uniform_int_distribution<int> type_dist(depth < 4 ? 0 : 3, 12);
  std::uniform_int_distribution<int> strlen_dist(0, 60);
  std::uniform_int_distribution<int> arrlen_dist(0, 4);
  std::uniform_int_distribution<std::int64_t> int_dist;
  std::uniform_real_distribution<double> real_dist(-1e6, 1e6);

  auto children = [&](int len) {
    std::vector<ns::frame> result;
    for (int i = 0; i < len; ++i)
      result.push_back(random_frame(prng, depth + 1));
    return result;
  };

  switch (type_dist(prng)) {
  case 0:
  case 1:
    return ns::make_array(children(arrlen_dist(prng)));
  case 2: {
    std::vector<std::pair<ns::frame, ns::frame>> entries;
    for (int i = arrlen_dist(prng); i > 0; --i)
      entries.emplace_back(random_frame(prng, depth + 1),
                           random_frame(prng, depth + 1));
    return ns::make_map(std::move(entries));
  }
  case 3:
    return ns::make_simple_string(
        random_chars(prng, strlen_dist(prng), 'a', 'z'));
  case 4:
    return ns::make_error(random_chars(prng, strlen_dist(prng), 'a', 'z'));
  case 5:
    return ns::make_integer(int_dist(prng));
  case 6:
    return ns::make_double(real_dist(prng));
  case 7:
    return ns::make_null_bulk_string();
  case 8:
    return ns::make_null();
  case 9:
    return ns::make_boolean(int_dist(prng) & 1);
  default:
    return ns::make_bulk_string(random_chars(prng, strlen_dist(prng), 0, 255));
  }
}

const std::vector<ns::frame> random_frames = []() {
  std::mt19937 prng(42);
  std::vector<ns::frame> result;
  for (int i = 0; i < 1 << 10; ++i)
    result.push_back(random_frame(prng));
  return result;
}();

const std::string random_data = []() {
  std::string result;
  for (const auto &f : random_frames)
    ns::encode(f, result);
  std::cout << "random_data is [" << result.size() << "] long" << std::endl;
  return result;
}();

void resp_decoding(benchmark::State &state) {
  const ns::decoder decoder;
  for (auto _ : state) {
    std::string_view rest = random_data;
    while (!rest.empty()) {
      auto result = decoder.decode(rest);
      auto &c = std::get<ns::complete>(result);
      benchmark::DoNotOptimize(c.value);
      rest.remove_prefix(c.consumed);
    }
  }
  state.SetBytesProcessed(state.iterations() * random_data.size());
}

void resp_encoding(benchmark::State &state) {
  std::string out;
  out.reserve(random_data.size());
  for (auto _ : state) {
    out.clear();
    for (const auto &f : random_frames)
      ns::encode(f, out);
    benchmark::DoNotOptimize(out.data());
    benchmark::ClobberMemory();
  }
  state.SetBytesProcessed(state.iterations() * random_data.size());
}

ns::frame request(std::initializer_list<std::string_view> args) {
  std::vector<ns::frame> elements;
  for (auto a : args)
    elements.push_back(ns::make_bulk_string(a));
  return ns::make_array(std::move(elements));
}

void command_dispatch(benchmark::State &state) {
  memkv::command_handler handler(std::make_shared<memkv::store>());
  const auto hset = request({"HSET", "hash", "field", "value"});
  const auto hget = request({"hget", "hash", "field"});
  for (auto _ : state) {
    auto set_reply = handler.execute(hset);
    auto get_reply = handler.execute(hget);
    benchmark::DoNotOptimize(set_reply);
    benchmark::DoNotOptimize(get_reply);
  }
}

} // namespace

BENCHMARK(resp_decoding);
BENCHMARK(resp_encoding);
BENCHMARK(command_dispatch);
