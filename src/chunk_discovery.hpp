#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

enum class Match_scope { path, name };

struct Part_file {
   std::filesystem::path path;
   std::uint64_t index = 0;
   std::uintmax_t size = 0;
};

struct Chunk_set {
   std::filesystem::path base_path;
   std::vector<Part_file> parts;
   std::uintmax_t total_size = 0;
};

struct Chunk_discovery {
   std::vector<std::filesystem::path> chunk_files;
   std::vector<std::filesystem::path> base_paths;

   bool chunks_found() const noexcept
   {
      return !chunk_files.empty();
   }
};

auto discover_chunks(const std::filesystem::path& root,
                     const std::vector<std::string>& extensions) -> Chunk_discovery;

// Gathers the parts of base_path, ordered by numeric index, with their sizes
// as they are on disk right now.
auto collect_chunk_set(const std::filesystem::path& root,
                       const std::filesystem::path& base_path, Match_scope scope)
   -> Chunk_set;
