#include "app_options.hpp"
#include "string_helpers.hpp"
#include "synced_cout.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace {

std::stringstream create_arg_stream(int argc, const char* const argv[])
{
   std::stringstream arg_stream;

   for (auto i = 1; i < argc; ++i) {
      arg_stream << std::quoted(argv[i]);
   }

   return arg_stream;
}

std::string read_string(std::istream& istream)
{
   std::string str;

   if (!(istream >> std::quoted(str))) {
      throw std::invalid_argument{"Missing value for option."};
   }

   return str;
}

void append_list(std::istream& istream, std::vector<std::string>& out)
{
   for_each_substr(std::string_view{read_string(istream)}, ';',
                   [&out](std::string_view item) { out.emplace_back(item); });
}

auto read_extension_list(std::istream& istream) -> std::vector<std::string>
{
   std::vector<std::string> extensions;
   append_list(istream, extensions);

   if (extensions.empty()) {
      throw std::invalid_argument{"Extension list is empty."};
   }

   for (const auto& extension : extensions) {
      if (extension.size() < 2 || extension.front() != '.') {
         throw std::invalid_argument{"Invalid extension specified: "s += extension};
      }
   }

   return extensions;
}

auto read_count(std::istream& istream) -> std::size_t
{
   const auto str = read_string(istream);

   std::size_t value = 0;

   const auto [last, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

   if (str.empty() || ec != std::errc{} || last != str.data() + str.size()) {
      throw std::invalid_argument{"Invalid number specified: "s += str};
   }

   return value;
}

std::istream& operator>>(std::istream& istream, Tool_mode& mode)
{
   const auto str = read_string(istream);

   if (str == "reassemble"sv) {
      mode = Tool_mode::reassemble;
   }
   else if (str == "scan"sv) {
      mode = Tool_mode::scan;
   }
   else if (str == "verify"sv) {
      mode = Tool_mode::verify;
   }
   else {
      throw std::invalid_argument{"Invalid tool mode specified."};
   }

   return istream;
}

std::istream& operator>>(std::istream& istream, Match_scope& scope)
{
   const auto str = read_string(istream);

   if (str == "path"sv) {
      scope = Match_scope::path;
   }
   else if (str == "name"sv) {
      scope = Match_scope::name;
   }
   else {
      throw std::invalid_argument{"Invalid match scope specified."};
   }

   return istream;
}
}

constexpr auto dir_opt_description{
   R"(<directory> Specify a directory tree to operate on.)"sv};

constexpr auto dirs_opt_description{
   R"(<directories> Specify a list of directory trees to operate on, delimited by ';'.
   Example: "-dirs site;mirror/site". Trees must not overlap.)"sv};

constexpr auto mode_opt_description{
   R"(<mode> Set the mode of operation for the tool. Can be 'reassemble', 'scan' or 'verify'.
   'reassemble' (default) - Rebuild chunked files, delete their parts, then check the structure.
   'scan' - Only list the chunk files and the files they would rebuild.
   'verify' - Only check the deployable file structure.)"sv};

constexpr auto extensions_opt_description{
   R"(<extensions> Set the extensions of chunked files, delimited by ';'. Default is '.data;.wasm'.)"sv};

constexpr auto match_opt_description{
   R"(<scope> Set where the parts of a file are looked for. Can be 'path' or 'name'.
   'path' (default) - Only beside the file being rebuilt.
   'name' - Anywhere in the tree, matched by file name alone.)"sv};

constexpr auto min_structure_opt_description{
   R"(<count> Set how many file categories must be present for the structure to be complete. Default is 3.)"sv};

constexpr auto checksum_opt_description{
   R"(Verify the CRC-32 of each rebuilt file against its parts, in addition to its size.)"sv};

constexpr auto report_opt_description{
   R"(<file> Append key=value results to the specified file, for example $GITHUB_OUTPUT.)"sv};

constexpr auto verbose_opt_description{R"(Enable verbose output.)"sv};

App_options::App_options()
{
   using Istr = std::istream;

   _options = {
      {"-dir"s, [this](Istr& istr) { _input_dirs.emplace_back(read_string(istr)); },
       dir_opt_description},
      {"-dirs"s, [this](Istr& istr) { append_list(istr, _input_dirs); },
       dirs_opt_description},
      {"-mode"s, [this](Istr& istr) { istr >> _tool_mode; }, mode_opt_description},
      {"-extensions"s,
       [this](Istr& istr) { _chunked_extensions = read_extension_list(istr); },
       extensions_opt_description},
      {"-match"s, [this](Istr& istr) { istr >> _match_scope; }, match_opt_description},
      {"-min_structure"s,
       [this](Istr& istr) { _min_structure_categories = read_count(istr); },
       min_structure_opt_description},
      {"-checksum"s, [this](Istr&) { _verify_checksum = true; },
       checksum_opt_description},
      {"-report"s, [this](Istr& istr) { _report_file = read_string(istr); },
       report_opt_description},
      {"-verbose"s, [this](Istr&) { _verbose = true; }, verbose_opt_description}};
}

App_options::App_options(const int argc, const char* const argv[]) : App_options()
{
   auto arg_stream = create_arg_stream(argc, argv);

   while (arg_stream) {
      std::string arg;

      if (!(arg_stream >> std::quoted(arg))) break;

      const auto handler = find_option_handler(arg);

      if (handler) {
         (*handler)(arg_stream);
      }
      else {
         synced_cout::warning("Ignoring unknown option '{}'", arg);
      }
   }
}

auto App_options::input_dirs() const noexcept -> const std::vector<std::string>&
{
   return _input_dirs;
}

Tool_mode App_options::tool_mode() const noexcept
{
   return _tool_mode;
}

auto App_options::chunked_extensions() const noexcept -> const std::vector<std::string>&
{
   return _chunked_extensions;
}

Match_scope App_options::match_scope() const noexcept
{
   return _match_scope;
}

std::size_t App_options::min_structure_categories() const noexcept
{
   return _min_structure_categories;
}

bool App_options::verify_checksum() const noexcept
{
   return _verify_checksum;
}

std::string App_options::report_file() const noexcept
{
   return _report_file;
}

bool App_options::verbose() const noexcept
{
   return _verbose;
}

void App_options::print_arguments(std::ostream& ostream) const noexcept
{
   ostream << '\n';

   for (const auto& option : _options) {
      ostream << ' ' << option.name << ' ';
      ostream.write(option.description.data(), option.description.length());
      ostream << '\n';
   }

   ostream << '\n';
}

auto App_options::find_option_handler(std::string_view name) noexcept
   -> App_options::Option_handler*
{
   const auto result =
      std::find_if(std::begin(_options), std::end(_options),
                   [name](const Option& option) { return (option.name == name); });

   if (result == std::end(_options)) return nullptr;

   return &result->handler;
}
