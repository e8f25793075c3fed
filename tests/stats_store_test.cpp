#include <catch2/catch.hpp>
#include "StatsErrors.hpp"
#include "StatsStore.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <sqlite3.h>

using test_util::at;
using test_util::make_record;
using test_util::TempDir;


TEST_CASE("Key is timestamp then input file", "[StatsStore]") {
   CHECK(StatsStore::make_key(make_record("src/a.cpp", at(1700000000, 42))) ==
         "1700000000.000000042:src/a.cpp");
   CHECK(StatsStore::make_key(make_record("/abs/b.cpp", at(0))) == "0.000000000:/abs/b.cpp");
}

TEST_CASE("Inserted record reads back equal", "[StatsStore]") {
   TempDir tmp;
   StatsStore store(tmp.file("tu_stats.db"));

   StatsRecord r = make_record("src/a.cpp", at(1700000000, 987654321));
   r.is_distributed = true;
   r.dist_retry_count = 2;
   r.preprocess_duration = std::chrono::nanoseconds(1234567);
   store.insert(r);

   auto all = store.scan();
   REQUIRE(all.size() == 1);
   REQUIRE(all[0] == r);
   REQUIRE(store.count() == 1);
}

TEST_CASE("Records survive reopening the store", "[StatsStore]") {
   TempDir tmp;
   const std::string path = tmp.file("nested/dir/tu_stats.db");
   const StatsRecord r = make_record("x.cc", at(77));
   {
      StatsStore store(path);
      store.insert(r);
   }
   StatsStore again(path);
   auto all = again.scan();
   REQUIRE(all.size() == 1);
   REQUIRE(all[0] == r);
}

TEST_CASE("Same file at three timestamps stays distinct", "[StatsStore]") {
   TempDir tmp;
   StatsStore store(tmp.file("tu_stats.db"));

   const StatsRecord a1 = make_record("A.cpp", at(100));
   const StatsRecord b2 = make_record("B.cpp", at(200));
   const StatsRecord a3 = make_record("A.cpp", at(300));
   store.insert(a1);
   store.insert(b2);
   store.insert(a3);

   auto all = store.scan();
   REQUIRE(all.size() == 3);
   std::sort(all.begin(), all.end(),
             [](const StatsRecord& x, const StatsRecord& y) { return x.timestamp < y.timestamp; });
   CHECK(all[0] == a1);
   CHECK(all[1] == b2);
   CHECK(all[2] == a3);
}

TEST_CASE("Identical timestamp and file collide, last write wins", "[StatsStore]") {
   TempDir tmp;
   StatsStore store(tmp.file("tu_stats.db"));

   StatsRecord first = make_record("A.cpp", at(100, 5));
   StatsRecord second = first;
   second.compile_duration = std::chrono::milliseconds(9999);
   store.insert(first);
   store.insert(second);

   auto all = store.scan();
   REQUIRE(all.size() == 1);
   CHECK(all[0] == second);

   // one nanosecond apart is a different key
   StatsRecord third = first;
   third.timestamp = at(100, 6);
   store.insert(third);
   CHECK(store.count() == 2);
}

TEST_CASE("Fresh store scans empty", "[StatsStore]") {
   TempDir tmp;
   StatsStore store(tmp.file("tu_stats.db"));
   CHECK(store.scan().empty());
   CHECK(store.count() == 0);
}

TEST_CASE("Unusable paths raise StorageOpenError", "[StatsStore]") {
   TempDir tmp;

   SECTION("path is a directory") {
      CHECK_THROWS_AS(StatsStore(tmp.path().string()), StorageOpenError);
   }
   SECTION("path is not a database") {
      const std::string junk = tmp.file("junk.db");
      {
         std::ofstream ofs(junk);
         ofs << "this is definitely not an sqlite database, just some text padding it out "
                "well past the size of the sqlite header so the engine has to inspect it\n";
      }
      CHECK_THROWS_AS(StatsStore(junk), StorageOpenError);
   }
   SECTION("parent is a regular file") {
      const std::string blocker = tmp.file("blocker");
      { std::ofstream ofs(blocker); ofs << "x"; }
      CHECK_THROWS_AS(StatsStore(blocker + "/tu_stats.db"), StorageOpenError);
   }
}

TEST_CASE("Undecodable stored value fails the scan", "[StatsStore]") {
   TempDir tmp;
   const std::string path = tmp.file("tu_stats.db");
   StatsStore store(path);
   store.insert(make_record("good.cpp", at(1)));

   // plant a corrupt value through a second connection
   sqlite3* raw = nullptr;
   REQUIRE(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
   REQUIRE(sqlite3_exec(raw, "INSERT INTO tu_stats(key,value) VALUES('2.000000000:bad.cpp','{oops')",
                        nullptr, nullptr, nullptr) == SQLITE_OK);
   sqlite3_close(raw);

   CHECK_THROWS_AS(store.scan(), StorageReadError);
   CHECK_THROWS_WITH(store.scan(), Catch::Contains("bad.cpp"));

   // the failed scan released its statement; the handle keeps working
   store.insert(make_record("later.cpp", at(3)));
   CHECK(store.count() == 3);
}

TEST_CASE("Rejected insert rolls back and leaves the store writable", "[StatsStore]") {
   TempDir tmp;
   const std::string path = tmp.file("tu_stats.db");
   StatsStore store(path);

   sqlite3* raw = nullptr;
   REQUIRE(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
   REQUIRE(sqlite3_exec(raw,
                        "CREATE TRIGGER reject_marked BEFORE INSERT ON tu_stats "
                        "WHEN NEW.key LIKE '%:reject.cpp' BEGIN SELECT RAISE(ABORT, 'rejected'); END;",
                        nullptr, nullptr, nullptr) == SQLITE_OK);
   sqlite3_close(raw);

   CHECK_THROWS_AS(store.insert(make_record("reject.cpp", at(1))), StorageWriteError);
   CHECK_THROWS_WITH(store.insert(make_record("reject.cpp", at(2))), Catch::Contains("rejected"));

   // a transaction left open would make this BEGIN IMMEDIATE fail
   store.insert(make_record("ok.cpp", at(3)));
   CHECK(store.count() == 1);
   CHECK(StatsStore(path).count() == 1);
}

TEST_CASE("Read-only handle reads but neither creates nor writes", "[StatsStore]") {
   TempDir tmp;
   const std::string path = tmp.file("tu_stats.db");

   CHECK_THROWS_AS(StatsStore(path, StatsStore::Mode::ReadOnly), StorageOpenError);
   CHECK_FALSE(std::filesystem::exists(path));

   StatsStore(path).insert(make_record("a.cpp", at(1)));
   StatsStore reader(path, StatsStore::Mode::ReadOnly);
   CHECK(reader.count() == 1);
   REQUIRE(reader.scan().size() == 1);
   CHECK_THROWS_AS(reader.insert(make_record("b.cpp", at(2))), StorageWriteError);
}

TEST_CASE("Concurrent inserts from many threads", "[StatsStore]") {
   TempDir tmp;
   StatsStore store(tmp.file("tu_stats.db"));

   const int kThreads = 8;
   const int kPerThread = 25;
   std::vector<std::thread> workers;
   for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&store, t] {
         for (int i = 0; i < kPerThread; ++i) {
            store.insert(make_record("t" + std::to_string(t) + ".cpp", at(1000 + i, t)));
         }
      });
   }
   for (auto& w : workers) w.join();

   CHECK(store.count() == static_cast<size_t>(kThreads * kPerThread));
   CHECK(store.scan().size() == static_cast<size_t>(kThreads * kPerThread));
}

TEST_CASE("Two handles on one path see each other's writes", "[StatsStore]") {
   TempDir tmp;
   const std::string path = tmp.file("tu_stats.db");
   StatsStore writer_a(path);
   StatsStore writer_b(path);

   writer_a.insert(make_record("a.cpp", at(1)));
   writer_b.insert(make_record("b.cpp", at(2)));

   CHECK(writer_a.count() == 2);
   CHECK(writer_b.scan().size() == 2);
}
