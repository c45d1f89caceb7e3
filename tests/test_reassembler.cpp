#include "checksum.hpp"
#include "reassembler.hpp"
#include "staged_file.hpp"
#include "test_helpers.hpp"
#include "type_pun.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

namespace {

const std::vector<std::string> default_extensions{".data", ".wasm"};

auto run_tree(const fs::path& root, const Reassembly_options& options = {})
   -> Run_summary
{
   auto discovery = discover_chunks(root, default_extensions);

   return reassemble_tree(root, std::move(discovery), options);
}

// Splits contents at the given boundaries into "<base>.part<first_index + i>".
void split_into_parts(const fs::path& base, const std::string& contents,
                      const std::vector<std::size_t>& boundaries)
{
   std::size_t begin = 0;
   std::size_t index = 0;

   for (const auto end : boundaries) {
      write_file(fs::path{base} += ".part" + std::to_string(index++),
                 contents.substr(begin, end - begin));
      begin = end;
   }

   write_file(fs::path{base} += ".part" + std::to_string(index),
              contents.substr(begin));
}
}

TEST_CASE("reassemble_tree rebuilds the documented example", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "AAA");
   write_file(dir / "build.data.part1", "BB");

   const auto summary = run_tree(dir.path());

   CHECK(summary.succeeded());
   CHECK(summary.chunks_found());
   CHECK(summary.chunk_count() == 2);
   CHECK(summary.totals.files_reassembled == 1);
   CHECK(summary.totals.bytes_written == 5);
   CHECK(summary.totals.failed_sets == 0);

   CHECK(read_file(dir / "build.data") == "AAABB");
   CHECK_FALSE(fs::exists(dir / "build.data.part0"));
   CHECK_FALSE(fs::exists(dir / "build.data.part1"));
   CHECK_FALSE(fs::exists(dir / "build.data.tmp"));
}

TEST_CASE("reassembly restores the original bytes for any split", "[reassembler]")
{
   std::string original;
   for (int i = 0; i < 5000; ++i) original += static_cast<char>(i * 31 % 256);

   const std::vector<std::vector<std::size_t>> splits{
      {}, {1}, {2500}, {0, 4999}, {7, 8, 9, 1000, 4000}, {5000}};

   for (const auto& boundaries : splits) {
      Temp_dir dir;
      split_into_parts(dir / "Build/game.wasm", original, boundaries);

      const auto summary = run_tree(dir.path());

      REQUIRE(summary.succeeded());
      CHECK(read_file(dir / "Build/game.wasm") == original);
      CHECK(count_files(dir.path()) == 1);
   }
}

TEST_CASE("parts are joined in numeric, not lexicographic, order", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part2", "two-");
   write_file(dir / "build.data.part10", "ten");
   write_file(dir / "build.data.part1", "one-");

   const auto summary = run_tree(dir.path());

   REQUIRE(summary.succeeded());
   CHECK(read_file(dir / "build.data") == "one-two-ten");
}

TEST_CASE("indices need not start at zero or be contiguous", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.wasm.part5", "b");
   write_file(dir / "build.wasm.part3", "a");
   write_file(dir / "build.wasm.part100", "c");

   REQUIRE(run_tree(dir.path()).succeeded());
   CHECK(read_file(dir / "build.wasm") == "abc");
}

TEST_CASE("a tree without chunks is left unchanged", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "index.html", "<html></html>");
   write_file(dir / "Build/build.data", "whole");

   const auto summary = run_tree(dir.path());

   CHECK(summary.succeeded());
   CHECK_FALSE(summary.chunks_found());
   CHECK(summary.results.empty());
   CHECK(count_files(dir.path()) == 2);
   CHECK(read_file(dir / "Build/build.data") == "whole");
}

TEST_CASE("a failing set does not stop the others", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "good.data.part0", "GO");
   write_file(dir / "good.data.part1", "OD");
   write_file(dir / "bad.wasm.part0", "BA");
   write_file(dir / "bad.wasm.part1", "D");

   auto discovery = discover_chunks(dir.path(), default_extensions);
   REQUIRE(discovery.base_paths.size() == 2);

   std::vector<Chunk_set> sets;
   for (const auto& base_path : discovery.base_paths) {
      sets.push_back(collect_chunk_set(dir.path(), base_path, Match_scope::path));
   }

   fs::remove(dir / "bad.wasm.part1");

   std::vector<Set_result> results;
   for (const auto& set : sets) results.push_back(reassemble_set(set, {}));

   const auto summary = make_run_summary(std::move(discovery), std::move(results));

   CHECK(summary.succeeded());
   CHECK(summary.totals.files_reassembled == 1);
   CHECK(summary.totals.failed_sets == 1);

   CHECK(read_file(dir / "good.data") == "GOOD");
   CHECK_FALSE(fs::exists(dir / "good.data.part0"));
   CHECK_FALSE(fs::exists(dir / "good.data.part1"));

   CHECK_FALSE(fs::exists(dir / "bad.wasm"));
   CHECK(read_file(dir / "bad.wasm.part0") == "BA");
}

TEST_CASE("a part removed after collection aborts only its set", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "AAA");
   write_file(dir / "build.data.part1", "BB");

   const auto set = collect_chunk_set(dir.path(), dir / "build.data", Match_scope::path);
   fs::remove(dir / "build.data.part1");

   const auto result = reassemble_set(set, {});

   CHECK(result.outcome == Set_outcome::invalid_part);
   CHECK_FALSE(result.succeeded());
   CHECK_FALSE(fs::exists(dir / "build.data"));
   CHECK_FALSE(fs::exists(dir / "build.data.tmp"));
   CHECK(read_file(dir / "build.data.part0") == "AAA");
}

TEST_CASE("a part truncated after collection is caught by the size check",
          "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "AAA");
   write_file(dir / "build.data.part1", "BBBB");

   const auto set = collect_chunk_set(dir.path(), dir / "build.data", Match_scope::path);
   REQUIRE(set.total_size == 7);

   fs::resize_file(dir / "build.data.part1", 1);

   const auto result = reassemble_set(set, {});

   CHECK(result.outcome == Set_outcome::size_mismatch);
   CHECK(result.expected_size == 7);
   CHECK(result.written_size == 4);

   CHECK_FALSE(fs::exists(dir / "build.data"));
   CHECK_FALSE(fs::exists(dir / "build.data.tmp"));
   CHECK(read_file(dir / "build.data.part0") == "AAA");
   CHECK(read_file(dir / "build.data.part1") == "B");
}

TEST_CASE("discovering chunks but rebuilding none fails the run", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.partA", "A");
   write_file(dir / "build.wasm.part-1", "B");

   const auto summary = run_tree(dir.path());

   CHECK(summary.chunks_found());
   CHECK(summary.totals.files_reassembled == 0);
   CHECK(summary.totals.failed_sets == 2);
   CHECK_FALSE(summary.succeeded());

   REQUIRE(summary.results.size() == 2);
   for (const auto& result : summary.results) {
      CHECK(result.outcome == Set_outcome::no_parts);
   }

   CHECK(fs::exists(dir / "build.data.partA"));
   CHECK(fs::exists(dir / "build.wasm.part-1"));
}

TEST_CASE("every set failing validation fails the run", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "a.data.part0", "A");
   write_file(dir / "b.wasm.part0", "B");

   auto discovery = discover_chunks(dir.path(), default_extensions);

   std::vector<Chunk_set> sets;
   for (const auto& base_path : discovery.base_paths) {
      sets.push_back(collect_chunk_set(dir.path(), base_path, Match_scope::path));
   }

   fs::remove(dir / "a.data.part0");
   fs::remove(dir / "b.wasm.part0");

   std::vector<Set_result> results;
   for (const auto& set : sets) results.push_back(reassemble_set(set, {}));

   const auto summary = make_run_summary(std::move(discovery), std::move(results));

   CHECK_FALSE(summary.succeeded());
   CHECK(summary.totals.failed_sets == 2);
}

TEST_CASE("path scope keeps same-named chunks in different directories apart",
          "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "one/build.data.part0", "1a");
   write_file(dir / "one/build.data.part1", "1b");
   write_file(dir / "two/build.data.part0", "2a");

   const auto summary = run_tree(dir.path());

   CHECK(summary.totals.files_reassembled == 2);
   CHECK(read_file(dir / "one/build.data") == "1a1b");
   CHECK(read_file(dir / "two/build.data") == "2a");
}

TEST_CASE("name scope gathers same-named chunks from the whole tree", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "one/build.data.part0", "1a");
   write_file(dir / "two/build.data.part1", "2b");

   const auto summary = run_tree(dir.path(), {.match_scope = Match_scope::name});

   // The first base path consumes every part, the second finds none left.
   CHECK(summary.succeeded());
   CHECK(summary.totals.files_reassembled == 1);
   CHECK(summary.totals.failed_sets == 1);
   CHECK(read_file(dir / "one/build.data") == "1a2b");
   CHECK_FALSE(fs::exists(dir / "two/build.data"));
   CHECK(count_files(dir.path()) == 1);
}

TEST_CASE("checksum verification accepts a correct rebuild", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "hello ");
   write_file(dir / "build.data.part1", "world");

   const auto summary = run_tree(dir.path(), {.verify_checksum = true});

   REQUIRE(summary.succeeded());
   CHECK(summary.results.at(0).outcome == Set_outcome::reassembled);
   CHECK(read_file(dir / "build.data") == "hello world");
}

TEST_CASE("empty parts are joined like any other", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "");
   write_file(dir / "build.data.part1", "X");
   write_file(dir / "build.data.part2", "");

   const auto summary = run_tree(dir.path(), {.verify_checksum = true});

   REQUIRE(summary.succeeded());
   CHECK(read_file(dir / "build.data") == "X");
}

TEST_CASE("reassembly replaces a stale target file", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data", "stale contents");
   write_file(dir / "build.data.part0", "new");

   REQUIRE(run_tree(dir.path()).succeeded());
   CHECK(read_file(dir / "build.data") == "new");
}

TEST_CASE("a target that cannot be written aborts only its set", "[reassembler]")
{
   Temp_dir dir;
   write_file(dir / "build.data.part0", "A");
   fs::create_directories(dir / "build.data.tmp" / "blocker");

   const auto set = collect_chunk_set(dir.path(), dir / "build.data", Match_scope::path);
   const auto result = reassemble_set(set, {});

   CHECK(result.outcome == Set_outcome::concat_failed);
   CHECK_FALSE(result.message.empty());
   CHECK(fs::exists(dir / "build.data.part0"));
   CHECK_FALSE(fs::exists(dir / "build.data"));
}

TEST_CASE("Staged_file is removed unless committed", "[reassembler][staged_file]")
{
   Temp_dir dir;
   const auto target = dir / "out.bin";

   {
      Staged_file staged{target};
      staged.write(gsl::span<const std::byte>{});
      CHECK(fs::exists(fs::path{target} += staged_extension));
   }

   CHECK_FALSE(fs::exists(fs::path{target} += staged_extension));
   CHECK_FALSE(fs::exists(target));
}

TEST_CASE("an abandoned, partly written staged file is removed",
          "[reassembler][staged_file]")
{
   Temp_dir dir;
   const auto target = dir / "build.data";

   {
      Staged_file staged{target};
      staged.write(view_string_as_bytes("partial"));

      CHECK(fs::exists(staged.staged_path()));
   }

   CHECK_FALSE(fs::exists(fs::path{target} += staged_extension));
   CHECK_FALSE(fs::exists(target));
}

TEST_CASE("check_staged_file rejects bytes changed after writing",
          "[reassembler][checksum]")
{
   Temp_dir dir;
   const auto target = dir / "build.data";
   const auto parts_crc = crc32_of(view_string_as_bytes("hello world"));

   {
      Staged_file staged{target};
      staged.write(view_string_as_bytes("hello world"));
      staged.finish();

      REQUIRE(check_staged_file(staged, target, 11, parts_crc).outcome ==
              Set_outcome::reassembled);

      // Same size, different content: only the checksum can tell.
      write_file(staged.staged_path(), "jello world");

      const auto check = check_staged_file(staged, target, 11, parts_crc);

      CHECK(check.outcome == Set_outcome::checksum_mismatch);
      CHECK(check.written_size == 11);
      CHECK_FALSE(check.message.empty());

      CHECK(check_staged_file(staged, target, 11, std::nullopt).outcome ==
            Set_outcome::reassembled);
      CHECK(check_staged_file(staged, target, 12, parts_crc).outcome ==
            Set_outcome::size_mismatch);
   }

   CHECK_FALSE(fs::exists(fs::path{target} += staged_extension));
   CHECK_FALSE(fs::exists(target));
}

TEST_CASE("a base path whose parts cannot be listed fails with invalid_part",
          "[reassembler]")
{
   Temp_dir dir;
   const auto root = dir / "site";
   write_file(root / "build.data.part0", "A");

   auto discovery = discover_chunks(root, default_extensions);
   REQUIRE(discovery.base_paths.size() == 1);

   fs::remove_all(root);

   const auto summary =
      reassemble_tree(root, std::move(discovery), {.match_scope = Match_scope::name});

   REQUIRE(summary.results.size() == 1);
   CHECK(summary.results.at(0).outcome == Set_outcome::invalid_part);
   CHECK(summary.results.at(0).base_path == root / "build.data");
   CHECK_FALSE(summary.results.at(0).message.empty());
   CHECK(summary.totals.failed_sets == 1);
   CHECK_FALSE(summary.succeeded());
}

TEST_CASE("Reassembly_totals folds set results", "[reassembler]")
{
   const Set_result ok{.base_path = "a",
                       .outcome = Set_outcome::reassembled,
                       .written_size = 10};
   const Set_result bad{.base_path = "b", .outcome = Set_outcome::size_mismatch};

   const auto totals = Reassembly_totals{} + ok + bad + ok;

   CHECK(totals.files_reassembled == 2);
   CHECK(totals.bytes_written == 20);
   CHECK(totals.failed_sets == 1);
}
