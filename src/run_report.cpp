#include "run_report.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace std::literals;

void Run_report::set(std::string_view key, std::string value)
{
   const auto existing =
      std::find_if(std::begin(_entries), std::end(_entries),
                   [key](const auto& entry) { return entry.first == key; });

   if (existing != std::end(_entries)) {
      existing->second = std::move(value);

      return;
   }

   _entries.emplace_back(std::string{key}, std::move(value));
}

void Run_report::set(std::string_view key, bool value)
{
   set(key, value ? "true"s : "false"s);
}

void Run_report::set(std::string_view key, std::uintmax_t value)
{
   set(key, std::to_string(value));
}

auto Run_report::str() const -> std::string
{
   std::string result;

   for (const auto& [key, value] : _entries) {
      result += fmt::format("{}={}\n", key, value);
   }

   return result;
}

void Run_report::append_to(const std::filesystem::path& path) const
{
   std::ofstream file{path, std::ios::app};

   if (!file) {
      throw std::runtime_error{
         fmt::format("Unable to open report file '{}'", path.string())};
   }

   file << str();

   if (!file) {
      throw std::runtime_error{
         fmt::format("Unable to write report file '{}'", path.string())};
   }
}
