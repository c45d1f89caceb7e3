#include "unchunk_app.hpp"
#include "input_roots.hpp"
#include "synced_cout.hpp"
#include "tree_processor.hpp"

#include "tbb/parallel_for.h"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <vector>

int run_unchunk(const App_options& app_options)
{
   const auto& input_dirs = app_options.input_dirs();

   if (input_dirs.empty()) {
      synced_cout::error("No input directory specified.");

      return EXIT_FAILURE;
   }

   const auto roots = resolve_input_roots(input_dirs);

   std::vector<Tree_outcome> outcomes(roots.size());

   tbb::parallel_for(std::size_t{0u}, roots.size(), [&](const std::size_t i) {
      outcomes[i] = process_tree(app_options, roots[i]);
   });

   if (!app_options.report_file().empty()) {
      make_run_report(outcomes).append_to(app_options.report_file());
   }

   const bool succeeded =
      std::all_of(std::cbegin(outcomes), std::cend(outcomes),
                  [](const Tree_outcome& outcome) { return outcome.succeeded(); });

   return succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
}
