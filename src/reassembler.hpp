#pragma once

#include "chunk_discovery.hpp"
#include "staged_file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Set_outcome {
   reassembled,
   no_parts,
   invalid_part,
   concat_failed,
   size_mismatch,
   checksum_mismatch
};

auto to_string(const Set_outcome outcome) noexcept -> std::string_view;

struct Set_result {
   std::filesystem::path base_path;
   Set_outcome outcome = Set_outcome::no_parts;
   std::size_t part_count = 0;
   std::uintmax_t expected_size = 0;
   std::uintmax_t written_size = 0;
   std::string message;

   bool succeeded() const noexcept
   {
      return outcome == Set_outcome::reassembled;
   }
};

struct Reassembly_totals {
   std::size_t files_reassembled = 0;
   std::uintmax_t bytes_written = 0;
   std::size_t failed_sets = 0;
};

auto operator+(Reassembly_totals totals, const Set_result& result) noexcept
   -> Reassembly_totals;

struct Reassembly_options {
   Match_scope match_scope = Match_scope::path;
   bool verify_checksum = false;
   bool verbose = false;
};

struct Run_summary {
   Chunk_discovery discovery;
   std::vector<Set_result> results;
   Reassembly_totals totals;

   bool chunks_found() const noexcept
   {
      return discovery.chunks_found();
   }

   auto chunk_count() const noexcept -> std::size_t
   {
      return discovery.chunk_files.size();
   }

   // Finding chunks and rebuilding none of them is the only failing outcome.
   bool succeeded() const noexcept
   {
      return !chunks_found() || totals.files_reassembled > 0;
   }
};

struct Staged_check {
   Set_outcome outcome = Set_outcome::reassembled;
   std::uintmax_t written_size = 0;
   std::string message;
};

// Compares a finished staged file with what was streamed into it: its size
// always, its CRC-32 when expected_crc is set. outcome stays reassembled when
// both agree.
auto check_staged_file(const Staged_file& staged, const std::filesystem::path& base_path,
                       const std::uintmax_t expected_size,
                       const std::optional<std::uint32_t> expected_crc) -> Staged_check;

// Rebuilds set.base_path from its parts. Never throws; every failure is
// reported through the returned result and leaves the parts untouched.
auto reassemble_set(const Chunk_set& set, const Reassembly_options& options)
   -> Set_result;

auto make_run_summary(Chunk_discovery discovery, std::vector<Set_result> results)
   -> Run_summary;

// Collects and rebuilds every discovered base path in order. A base path
// whose parts cannot be listed fails with invalid_part.
auto reassemble_tree(const std::filesystem::path& root, Chunk_discovery discovery,
                     const Reassembly_options& options) -> Run_summary;

void print_discovery(const Chunk_discovery& discovery);

void print_run_summary(const Run_summary& summary);
