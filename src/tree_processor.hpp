#pragma once

#include "app_options.hpp"
#include "reassembler.hpp"
#include "run_report.hpp"
#include "structure_check.hpp"

#include <filesystem>
#include <optional>
#include <vector>

struct Tree_outcome {
   std::filesystem::path root;
   Tool_mode mode = Tool_mode::reassemble;
   std::optional<Run_summary> summary;
   std::optional<Structure_report> structure;
   bool error = false;

   bool succeeded() const noexcept
   {
      if (error) return false;

      if (mode != Tool_mode::reassemble || !summary) return true;

      return summary->succeeded();
   }
};

// Runs the selected tool mode over one tree. Exceptions are reported and
// turn into an outcome with error set.
auto process_tree(const App_options& options, const std::filesystem::path& root) noexcept
   -> Tree_outcome;

auto make_run_report(const std::vector<Tree_outcome>& outcomes) -> Run_report;
