#pragma once

#include "chunk_discovery.hpp"
#include "structure_check.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

enum class Tool_mode { reassemble, scan, verify };

class App_options {
public:
   App_options(const App_options&) = delete;
   App_options& operator=(const App_options&) = delete;
   App_options(App_options&&) = delete;
   App_options& operator=(App_options&&) = delete;

   App_options(const int argc, const char* const argv[]);

   auto input_dirs() const noexcept -> const std::vector<std::string>&;

   Tool_mode tool_mode() const noexcept;

   auto chunked_extensions() const noexcept -> const std::vector<std::string>&;

   Match_scope match_scope() const noexcept;

   std::size_t min_structure_categories() const noexcept;

   bool verify_checksum() const noexcept;

   std::string report_file() const noexcept;

   bool verbose() const noexcept;

   void print_arguments(std::ostream& ostream) const noexcept;

private:
   App_options();

   using Option_handler = std::function<void(std::istream&)>;

   struct Option {
      std::string name;
      Option_handler handler;
      std::string_view description;
   };

   auto find_option_handler(std::string_view name) noexcept -> Option_handler*;

   std::vector<Option> _options;

   std::vector<std::string> _input_dirs;
   Tool_mode _tool_mode = Tool_mode::reassemble;
   std::vector<std::string> _chunked_extensions{".data", ".wasm"};
   Match_scope _match_scope = Match_scope::path;
   std::size_t _min_structure_categories = default_min_structure_categories;
   bool _verify_checksum = false;
   std::string _report_file;
   bool _verbose = false;
};
