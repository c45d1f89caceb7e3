#include "chunk_discovery.hpp"
#include "chunk_naming.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

using namespace std::literals;

namespace {

constexpr auto iteration_options = fs::directory_options::skip_permission_denied;

bool is_chunk_file(const std::string& file_name,
                   const std::vector<std::string>& extensions) noexcept
{
   return std::any_of(std::cbegin(extensions), std::cend(extensions),
                      [&](const std::string& extension) {
                         return matches_chunk_pattern(file_name, extension);
                      });
}

auto derive_base_path(const fs::path& chunk_file) -> fs::path
{
   const auto file_name = chunk_file.filename().string();
   const auto part_name = split_part_name(file_name);

   if (!part_name) return chunk_file;

   return chunk_file.parent_path() / std::string{part_name->base};
}

void add_if_part(const fs::directory_entry& entry, const std::string& base_name,
                 std::vector<Part_file>& parts)
{
   std::error_code ec;

   if (!entry.is_regular_file(ec)) return;

   const auto file_name = entry.path().filename().string();
   const auto part_name = split_part_name(file_name);

   if (!part_name || part_name->base != base_name) return;

   const auto size = entry.file_size(ec);

   parts.push_back({.path = entry.path(),
                    .index = part_name->index,
                    .size = ec ? std::uintmax_t{0} : size});
}

void sort_parts(std::vector<Part_file>& parts)
{
   std::sort(std::begin(parts), std::end(parts),
             [](const Part_file& left, const Part_file& right) {
                if (left.index != right.index) return left.index < right.index;

                return left.path < right.path;
             });
}
}

auto discover_chunks(const fs::path& root, const std::vector<std::string>& extensions)
   -> Chunk_discovery
{
   if (!fs::is_directory(root)) {
      throw std::invalid_argument{"Directory does not exist: "s += root.string()};
   }

   std::set<fs::path> chunk_files;
   std::set<fs::path> base_paths;

   for (const auto& entry : fs::recursive_directory_iterator{root, iteration_options}) {
      if (!entry.is_regular_file()) continue;

      if (!is_chunk_file(entry.path().filename().string(), extensions)) continue;

      chunk_files.insert(entry.path());
      base_paths.insert(derive_base_path(entry.path()));
   }

   Chunk_discovery discovery;
   discovery.chunk_files.assign(std::cbegin(chunk_files), std::cend(chunk_files));
   discovery.base_paths.assign(std::cbegin(base_paths), std::cend(base_paths));

   return discovery;
}

auto collect_chunk_set(const fs::path& root, const fs::path& base_path,
                       const Match_scope scope) -> Chunk_set
{
   const auto base_name = base_path.filename().string();

   Chunk_set set{.base_path = base_path};

   if (scope == Match_scope::path) {
      const auto directory = base_path.parent_path();

      if (fs::is_directory(directory)) {
         for (const auto& entry : fs::directory_iterator{directory, iteration_options}) {
            add_if_part(entry, base_name, set.parts);
         }
      }
   }
   else {
      for (const auto& entry : fs::recursive_directory_iterator{root, iteration_options}) {
         add_if_part(entry, base_name, set.parts);
      }
   }

   sort_parts(set.parts);

   for (const auto& part : set.parts) set.total_size += part.size;

   return set;
}
