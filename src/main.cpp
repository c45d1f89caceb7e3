#include "app_options.hpp"
#include "synced_cout.hpp"
#include "unchunk_app.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

using namespace std::literals;

const auto usage = R"(Usage: unchunk <options>

Rebuilds files split into "<file>.part<N>" chunks and removes the chunks.

Options:)"s;

int main(int argc, char* argv[])
{
   std::ios_base::sync_with_stdio(false);

   if (argc == 1) {
      std::cout << usage;
      App_options{0, nullptr}.print_arguments(std::cout);
      std::cout << '\n';

      return EXIT_FAILURE;
   }

   try {
      const App_options app_options{argc, argv};

      return run_unchunk(app_options);
   }
   catch (std::exception& e) {
      synced_cout::error("{}", e.what());

      return EXIT_FAILURE;
   }
}
