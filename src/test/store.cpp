#include "catch2/catch_all.hpp"

#include <store.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using memkv::if_absent;
using memkv::store;

class fixture {
protected:
  std::size_t hash_size(std::string_view key) const {
    return db_.read<store::hash_t>(key, [](const store::hash_t *h) {
      return h ? h->size() : std::size_t(0);
    });
  }

  store db_{8};
};

} // namespace

TEST_CASE("shard count must be a power of two") {
  CHECK_THROWS_AS(store(0), std::invalid_argument);
  CHECK_THROWS_AS(store(3), std::invalid_argument);
  CHECK_NOTHROW(store(1));
  CHECK_NOTHROW(store(64));
}

TEST_CASE_METHOD(fixture, "set get and del") {
  db_.set("key", "value");
  const auto value = db_.get("key");
  REQUIRE(value);
  CHECK(std::get<store::string_t>(*value) == "value");

  CHECK(db_.del("key"));
  CHECK_FALSE(db_.del("key"));
  CHECK_FALSE(db_.get("key"));
}

TEST_CASE_METHOD(fixture, "set replaces any type") {
  db_.write<store::list_t>("key", if_absent::create,
                           [](store::list_t *l) { l->push_back("a"); });
  CHECK(db_.type("key") == "list");
  db_.set("key", "value");
  CHECK(db_.type("key") == "string");
}

TEST_CASE_METHOD(fixture, "type") {
  db_.set("s", "v");
  db_.write<store::hash_t>("h", if_absent::create,
                           [](store::hash_t *h) { (*h)["f"] = "v"; });
  db_.write<store::list_t>("l", if_absent::create,
                           [](store::list_t *l) { l->push_back("a"); });
  db_.write<store::set_t>("z", if_absent::create,
                          [](store::set_t *s) { s->emplace("a"); });

  CHECK(db_.type("s") == "string");
  CHECK(db_.type("h") == "hash");
  CHECK(db_.type("l") == "list");
  CHECK(db_.type("z") == "set");
  CHECK(db_.type("missing") == "none");
  CHECK(db_.size() == 4);

  db_.clear();
  CHECK(db_.size() == 0);
  CHECK_FALSE(db_.exists("s"));
}

TEST_CASE_METHOD(fixture, "absent keys read as nullptr") {
  CHECK(hash_size("missing") == 0);
  CHECK_FALSE(db_.exists("missing"));
}

TEST_CASE_METHOD(fixture, "skip doesn't create") {
  const bool saw_null = db_.write<store::hash_t>(
      "missing", if_absent::skip, [](store::hash_t *h) { return !h; });
  CHECK(saw_null);
  CHECK_FALSE(db_.exists("missing"));
}

TEST_CASE_METHOD(fixture, "wrong type is rejected without mutation") {
  db_.set("key", "value");

  bool called = false;
  CHECK_THROWS_AS(db_.write<store::hash_t>("key", if_absent::create,
                                           [&](store::hash_t *) {
                                             called = true;
                                           }),
                  memkv::wrong_type);
  CHECK_THROWS_AS(db_.read<store::list_t>("key",
                                          [&](const store::list_t *) {
                                            called = true;
                                          }),
                  memkv::wrong_type);

  CHECK_FALSE(called);
  CHECK(std::get<store::string_t>(*db_.get("key")) == "value");
}

TEST_CASE_METHOD(fixture, "emptied containers are removed") {
  db_.write<store::list_t>("key", if_absent::create, [](store::list_t *l) {
    l->push_back("a");
    l->push_back("b");
  });
  REQUIRE(db_.exists("key"));

  db_.write<store::list_t>("key", if_absent::skip,
                           [](store::list_t *l) { l->clear(); });
  CHECK_FALSE(db_.exists("key"));
}

TEST_CASE_METHOD(fixture, "empty string values are kept") {
  db_.set("key", "");
  CHECK(db_.exists("key"));
}

TEST_CASE_METHOD(fixture, "a key created for a failed write is rolled back") {
  CHECK_THROWS_AS(
      db_.write<store::string_t>(
          "key", if_absent::create,
          [](store::string_t *) -> int { throw std::runtime_error("nope"); },
          "0"),
      std::runtime_error);
  CHECK_FALSE(db_.exists("key"));
}

TEST_CASE_METHOD(fixture, "an existing key survives a failed write") {
  db_.set("key", "abc");
  CHECK_THROWS_AS(
      db_.write<store::string_t>(
          "key", if_absent::create,
          [](store::string_t *) -> int { throw std::runtime_error("nope"); }),
      std::runtime_error);
  CHECK(std::get<store::string_t>(*db_.get("key")) == "abc");
}

TEST_CASE_METHOD(fixture, "initial value for created keys") {
  const auto seen = db_.write<store::string_t>(
      "key", if_absent::create, [](store::string_t *s) { return *s; }, "0");
  CHECK(seen == "0");
}

TEST_CASE_METHOD(fixture, "concurrent writers on disjoint keys") {
  constexpr int threads = 8;
  constexpr int keys_per_thread = 500;

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([this, t] {
      for (int i = 0; i < keys_per_thread; ++i) {
        const auto key = "key:" + std::to_string(t) + ":" + std::to_string(i);
        db_.write<store::hash_t>(
            key, if_absent::create,
            [&](store::hash_t *h) { (*h)["field"] = std::to_string(i); });
      }
    });
  }
  for (auto &w : workers)
    w.join();

  CHECK(db_.size() == threads * keys_per_thread);
  for (int t = 0; t < threads; ++t) {
    for (int i = 0; i < keys_per_thread; ++i) {
      const auto key = "key:" + std::to_string(t) + ":" + std::to_string(i);
      const auto value = db_.read<store::hash_t>(
          key, [](const store::hash_t *h) { return h->at("field"); });
      REQUIRE(value == std::to_string(i));
    }
  }
}

TEST_CASE_METHOD(fixture, "concurrent writers on one key lose no updates") {
  constexpr int threads = 8;
  constexpr int fields_per_thread = 250;

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([this, t] {
      for (int i = 0; i < fields_per_thread; ++i) {
        db_.write<store::hash_t>(
            "shared", if_absent::create, [&](store::hash_t *h) {
              (*h)[std::to_string(t) + ":" + std::to_string(i)] = "v";
            });
      }
    });
  }
  for (auto &w : workers)
    w.join();

  CHECK(hash_size("shared") == threads * fields_per_thread);
}
