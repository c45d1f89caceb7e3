#include "tree_processor.hpp"
#include "synced_cout.hpp"

#include <algorithm>
#include <exception>

namespace fs = std::filesystem;

using namespace std::literals;

namespace {

auto make_reassembly_options(const App_options& options) noexcept -> Reassembly_options
{
   return {.match_scope = options.match_scope(),
           .verify_checksum = options.verify_checksum(),
           .verbose = options.verbose()};
}

void run_discovery(const App_options& options, const fs::path& root, Tree_outcome& outcome)
{
   auto discovery = discover_chunks(root, options.chunked_extensions());

   print_discovery(discovery);

   if (options.tool_mode() == Tool_mode::reassemble && discovery.chunks_found()) {
      synced_cout::print("Starting chunk reassembly, "s,
                         std::to_string(discovery.chunk_files.size()),
                         " chunks found\n"s);

      outcome.summary =
         reassemble_tree(root, std::move(discovery), make_reassembly_options(options));

      print_run_summary(*outcome.summary);
   }
   else {
      outcome.summary = make_run_summary(std::move(discovery), {});
   }
}
}

auto process_tree(const App_options& options, const fs::path& root) noexcept
   -> Tree_outcome
{
   Tree_outcome outcome;

   try {
      outcome.root = root;
      outcome.mode = options.tool_mode();

      synced_cout::print("Processing directory: "s, root.string(), '\n');

      if (options.tool_mode() != Tool_mode::verify) {
         run_discovery(options, root, outcome);
      }

      if (options.tool_mode() != Tool_mode::scan) {
         outcome.structure = check_structure(root, options.chunked_extensions(),
                                             options.min_structure_categories());

         print_structure_report(*outcome.structure);
      }
   }
   catch (std::exception& e) {
      synced_cout::print(
         "Error: Exception occured while processing directory.\n   Directory: "s,
         root.string(), '\n', "   Message: "s, e.what(), '\n');

      outcome.error = true;
   }

   return outcome;
}

auto make_run_report(const std::vector<Tree_outcome>& outcomes) -> Run_report
{
   bool chunks_found = false;
   std::uintmax_t chunk_count = 0;
   Reassembly_totals totals;
   bool any_structure = false;
   bool structure_complete = true;

   for (const auto& outcome : outcomes) {
      if (outcome.summary) {
         chunks_found = chunks_found || outcome.summary->chunks_found();
         chunk_count += outcome.summary->chunk_count();
         totals.files_reassembled += outcome.summary->totals.files_reassembled;
         totals.bytes_written += outcome.summary->totals.bytes_written;
         totals.failed_sets += outcome.summary->totals.failed_sets;
      }

      if (outcome.structure) {
         any_structure = true;
         structure_complete = structure_complete && outcome.structure->complete();
      }
   }

   const bool succeeded =
      std::all_of(std::cbegin(outcomes), std::cend(outcomes),
                  [](const Tree_outcome& outcome) { return outcome.succeeded(); });

   Run_report report;

   report.set("chunks_found"sv, chunks_found);
   report.set("chunk_count"sv, chunk_count);
   report.set("files_reassembled"sv, std::uintmax_t{totals.files_reassembled});
   report.set("total_bytes"sv, totals.bytes_written);
   report.set("failed_sets"sv, std::uintmax_t{totals.failed_sets});

   if (any_structure) report.set("structure_complete"sv, structure_complete);

   report.set("succeeded"sv, succeeded);

   return report;
}
