#include "reassembler.hpp"
#include "checksum.hpp"
#include "mapped_file.hpp"
#include "staged_file.hpp"
#include "string_helpers.hpp"
#include "synced_cout.hpp"

#include <fmt/format.h>

#include <exception>
#include <fstream>
#include <numeric>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

using namespace std::literals;

namespace {

auto find_inaccessible_part(const Chunk_set& set) -> std::optional<fs::path>
{
   for (const auto& part : set.parts) {
      std::error_code ec;

      if (!fs::is_regular_file(part.path, ec)) return part.path;

      if (!std::ifstream{part.path, std::ios::binary}) return part.path;
   }

   return std::nullopt;
}

void remove_parts(const Chunk_set& set, const bool verbose)
{
   for (const auto& part : set.parts) {
      std::error_code ec;

      if (!fs::remove(part.path, ec) || ec) {
         synced_cout::warning("Unable to remove chunk {}: {}", part.path.string(),
                              ec ? ec.message() : "file no longer exists"s);
      }
      else if (verbose) {
         synced_cout::info("Removed chunk {}", part.path.filename().string());
      }
   }
}

auto fail(Set_result& result, const Set_outcome outcome, std::string message)
   -> Set_result
{
   result.outcome = outcome;
   result.message = std::move(message);

   synced_cout::error("{}", result.message);

   return result;
}

auto collect_and_reassemble(const fs::path& root, const fs::path& base_path,
                            const Reassembly_options& options) -> Set_result
{
   Chunk_set set;

   try {
      set = collect_chunk_set(root, base_path, options.match_scope);
   }
   catch (std::exception& e) {
      Set_result result{.base_path = base_path};

      return fail(result, Set_outcome::invalid_part,
                  fmt::format("Unable to collect parts for {}: {}", base_path.string(),
                              e.what()));
   }

   return reassemble_set(set, options);
}
}

auto to_string(const Set_outcome outcome) noexcept -> std::string_view
{
   switch (outcome) {
   case Set_outcome::reassembled:
      return "reassembled"sv;
   case Set_outcome::no_parts:
      return "no parts"sv;
   case Set_outcome::invalid_part:
      return "invalid part"sv;
   case Set_outcome::concat_failed:
      return "concatenation failed"sv;
   case Set_outcome::size_mismatch:
      return "size mismatch"sv;
   case Set_outcome::checksum_mismatch:
      return "checksum mismatch"sv;
   }

   return "unknown"sv;
}

auto operator+(Reassembly_totals totals, const Set_result& result) noexcept
   -> Reassembly_totals
{
   if (result.succeeded()) {
      totals.files_reassembled += 1;
      totals.bytes_written += result.written_size;
   }
   else {
      totals.failed_sets += 1;
   }

   return totals;
}

auto check_staged_file(const Staged_file& staged, const fs::path& base_path,
                       const std::uintmax_t expected_size,
                       const std::optional<std::uint32_t> expected_crc) -> Staged_check
{
   Staged_check check{.written_size = staged.size_on_disk()};

   if (check.written_size != expected_size) {
      check.outcome = Set_outcome::size_mismatch;
      check.message = fmt::format("Size mismatch for {} (expected: {}, got: {})",
                                  base_path.string(), expected_size, check.written_size);

      return check;
   }

   if (!expected_crc) return check;

   const Mapped_file written{staged.staged_path()};
   const auto written_crc = crc32_of(written.bytes());

   if (written_crc != *expected_crc) {
      check.outcome = Set_outcome::checksum_mismatch;
      check.message = fmt::format("Checksum mismatch for {} (expected: {:08x}, got: {:08x})",
                                  base_path.string(), *expected_crc, written_crc);
   }

   return check;
}

auto reassemble_set(const Chunk_set& set, const Reassembly_options& options)
   -> Set_result
{
   Set_result result{.base_path = set.base_path,
                     .part_count = set.parts.size(),
                     .expected_size = set.total_size};

   synced_cout::print("Processing: "s, set.base_path.string(), '\n');

   if (set.parts.empty()) {
      result.outcome = Set_outcome::no_parts;
      result.message = fmt::format("No parts found for {}", set.base_path.string());

      synced_cout::warning("{}", result.message);

      return result;
   }

   synced_cout::print(fmt::format("Found {} parts for {}, total size {} ({} bytes)\n",
                                  set.parts.size(), set.base_path.filename().string(),
                                  format_megabytes(set.total_size), set.total_size));

   if (options.verbose) {
      for (const auto& part : set.parts) {
         synced_cout::info("  - {} ({} bytes)", part.path.string(), part.size);
      }
   }

   if (const auto part = find_inaccessible_part(set); part) {
      return fail(result, Set_outcome::invalid_part,
                  fmt::format("Part not accessible: {}, skipping {}", part->string(),
                              set.base_path.string()));
   }

   try {
      Staged_file staged{set.base_path};
      Crc32 parts_crc;

      for (const auto& part : set.parts) {
         const Mapped_file mapped{part.path};

         staged.write(mapped.bytes());

         if (options.verify_checksum) parts_crc.update(mapped.bytes());
      }

      staged.finish();

      std::optional<std::uint32_t> expected_crc;

      if (options.verify_checksum) expected_crc = parts_crc.value();

      auto check = check_staged_file(staged, set.base_path, set.total_size, expected_crc);

      result.written_size = check.written_size;

      if (check.outcome != Set_outcome::reassembled) {
         return fail(result, check.outcome, std::move(check.message));
      }

      if (options.verify_checksum && options.verbose) {
         synced_cout::info("CRC-32 of {} is {}", set.base_path.string(), parts_crc.hex());
      }

      staged.commit();
   }
   catch (std::exception& e) {
      return fail(result, Set_outcome::concat_failed,
                  fmt::format("Failed to concatenate parts for {}: {}",
                              set.base_path.string(), e.what()));
   }

   result.outcome = Set_outcome::reassembled;

   synced_cout::print(fmt::format("Reassembled {}, final size {}\n",
                                  set.base_path.string(),
                                  format_megabytes(result.written_size)));

   remove_parts(set, options.verbose);

   return result;
}

auto make_run_summary(Chunk_discovery discovery, std::vector<Set_result> results)
   -> Run_summary
{
   const auto totals =
      std::accumulate(std::cbegin(results), std::cend(results), Reassembly_totals{});

   return {.discovery = std::move(discovery),
           .results = std::move(results),
           .totals = totals};
}

auto reassemble_tree(const fs::path& root, Chunk_discovery discovery,
                     const Reassembly_options& options) -> Run_summary
{
   std::vector<Set_result> results;
   results.reserve(discovery.base_paths.size());

   for (const auto& base_path : discovery.base_paths) {
      results.push_back(collect_and_reassemble(root, base_path, options));
   }

   return make_run_summary(std::move(discovery), std::move(results));
}

void print_discovery(const Chunk_discovery& discovery)
{
   if (!discovery.chunks_found()) {
      synced_cout::print("No chunk files found, files are already complete\n"s);

      return;
   }

   std::string listing = fmt::format("Found {} chunk files:\n", discovery.chunk_files.size());

   for (const auto& file : discovery.chunk_files) {
      listing += fmt::format("  {}\n", file.string());
   }

   listing += "Base files to reassemble:\n"sv;

   for (const auto& base_path : discovery.base_paths) {
      listing += fmt::format("  {}\n", base_path.string());
   }

   synced_cout::print(listing);
}

void print_run_summary(const Run_summary& summary)
{
   synced_cout::print(fmt::format("Reassembly summary:\n"
                                  "   Files reassembled: {}\n"
                                  "   Failed: {}\n"
                                  "   Total size: {}\n",
                                  summary.totals.files_reassembled,
                                  summary.totals.failed_sets,
                                  format_megabytes(summary.totals.bytes_written)));

   if (!summary.succeeded()) {
      synced_cout::error("No files were reassembled, check the log for errors");
   }
}
