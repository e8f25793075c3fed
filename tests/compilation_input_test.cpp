#include <catch2/catch.hpp>
#include "CompilationInput.hpp"
#include "test_util.hpp"

#include <stdexcept>

using test_util::at;


TEST_CASE("Compilation description becomes a ranked record", "[CompilationInput]") {
   const std::string text = R"({
      "input_file": "src/net/socket.cpp",
      "preprocessed_size": 4096,
      "preprocess_ms": 12,
      "compile_ms": 340,
      "dist_retry_count": 1,
      "is_distributed": true,
      "includes": [
         {"path": "/usr/include/c++/11/vector", "size": 100},
         {"path": "/usr/include/boost/asio.hpp", "size": 900},
         {"path": "/usr/include/c++/11/string", "size": 200},
         {"path": "socket.h", "size": 10}
      ]
   })";

   StatsRecord r = stats_record_from_compilation(text, 10, at(1234, 5));
   CHECK(r.input_file == "src/net/socket.cpp");
   CHECK(r.preprocessed_size == 4096);
   CHECK(r.num_includes == 4);
   CHECK(r.preprocess_duration == std::chrono::milliseconds(12));
   CHECK(r.compile_duration == std::chrono::milliseconds(340));
   CHECK(r.dist_retry_count == 1);
   CHECK(r.is_distributed);
   CHECK(r.timestamp == at(1234, 5));

   REQUIRE(r.top_includes_by_count.size() == 3);
   CHECK(r.top_includes_by_count[0] == IncludeStats{"/usr/include/c++", 2, 300});
   CHECK(r.top_includes_by_count[1] == IncludeStats{"/usr/include/boost", 1, 900});
   CHECK(r.top_includes_by_count[2] == IncludeStats{".", 1, 10});

   REQUIRE(r.top_includes_by_size.size() == 3);
   CHECK(r.top_includes_by_size[0].path_prefix == "/usr/include/boost");
   CHECK(r.top_includes_by_size[1].path_prefix == "/usr/include/c++");
}

TEST_CASE("Top-N bound applies to parsed includes", "[CompilationInput]") {
   StatsRecord r = stats_record_from_compilation(
         R"({"input_file":"a.c","includes":[{"path":"/x/a.h"},{"path":"/y/b.h"},{"path":"/z/c.h"}]})",
         2, at(1));
   CHECK(r.num_includes == 3);
   CHECK(r.top_includes_by_count.size() == 2);
   CHECK(r.top_includes_by_size.size() == 2);
}

TEST_CASE("Malformed compilation descriptions are rejected", "[CompilationInput]") {
   CHECK_THROWS_AS(stats_record_from_compilation("nope", 10, at(1)), std::runtime_error);
   CHECK_THROWS_AS(stats_record_from_compilation("{}", 10, at(1)), std::runtime_error);
   CHECK_THROWS_AS(stats_record_from_compilation(R"({"input_file":"a.c","includes":{}})", 10, at(1)),
                   std::runtime_error);
   CHECK_THROWS_AS(stats_record_from_compilation(R"({"input_file":"a.c","includes":[{"size":1}]})", 10, at(1)),
                   std::runtime_error);
   CHECK_THROWS_AS(stats_record_from_compilation(R"({"input_file":"a.c","compile_ms":-3})", 10, at(1)),
                   std::runtime_error);
   CHECK_THROWS_AS(stats_record_from_compilation(R"({"input_file":"a.c","is_distributed":1})", 10, at(1)),
                   std::runtime_error);
}

TEST_CASE("Durations beyond the nanosecond range are rejected", "[CompilationInput]") {
   CHECK_THROWS_AS(stats_record_from_compilation(R"({"input_file":"a.c","compile_ms":10000000000000})", 10, at(1)),
                   std::runtime_error);
   CHECK_THROWS_AS(
         stats_record_from_compilation(R"({"input_file":"a.c","preprocess_ms":18446744073709551615})", 10, at(1)),
         std::runtime_error);

   // the largest representable value still fits
   StatsRecord r = stats_record_from_compilation(R"({"input_file":"a.c","compile_ms":9223372036854})", 10, at(1));
   CHECK(r.compile_duration == std::chrono::milliseconds(9223372036854LL));
   CHECK(r.compile_duration.count() > 0);
}
