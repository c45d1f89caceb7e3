#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

constexpr std::size_t default_min_structure_categories = 3;

struct Structure_category {
   std::string name;
   std::size_t file_count = 0;

   bool present() const noexcept
   {
      return file_count != 0;
   }
};

struct Structure_report {
   std::vector<Structure_category> categories;
   std::size_t min_categories = default_min_structure_categories;

   auto present_count() const noexcept -> std::size_t;

   bool complete() const noexcept
   {
      return present_count() >= min_categories;
   }
};

// Counts the files of each deployable category: one per chunked extension,
// "*.framework.js", "*.loader.js" and an index.html at the root. Advisory
// only, the result never decides the outcome of a run.
auto check_structure(const std::filesystem::path& root,
                     const std::vector<std::string>& chunked_extensions,
                     std::size_t min_categories) -> Structure_report;

void print_structure_report(const Structure_report& report);
