#include "structure_check.hpp"
#include "string_helpers.hpp"
#include "synced_cout.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

using namespace std::literals;

namespace {

constexpr auto framework_suffix = ".framework.js"sv;
constexpr auto loader_suffix = ".loader.js"sv;
constexpr auto entry_point_name = "index.html"sv;

}

auto Structure_report::present_count() const noexcept -> std::size_t
{
   return static_cast<std::size_t>(
      std::count_if(std::cbegin(categories), std::cend(categories),
                    [](const Structure_category& category) { return category.present(); }));
}

auto check_structure(const fs::path& root,
                     const std::vector<std::string>& chunked_extensions,
                     const std::size_t min_categories) -> Structure_report
{
   Structure_report report{.min_categories = min_categories};

   for (const auto& extension : chunked_extensions) {
      report.categories.push_back({.name = extension});
   }

   const auto framework_index = report.categories.size();
   report.categories.push_back({.name = std::string{framework_suffix}});

   const auto loader_index = report.categories.size();
   report.categories.push_back({.name = std::string{loader_suffix}});

   for (const auto& entry : fs::recursive_directory_iterator{
           root, fs::directory_options::skip_permission_denied}) {
      std::error_code ec;

      if (!entry.is_regular_file(ec)) continue;

      const auto file_name = entry.path().filename().string();

      for (std::size_t i = 0; i < chunked_extensions.size(); ++i) {
         if (ends_with(std::string_view{file_name}, chunked_extensions[i])) {
            report.categories[i].file_count += 1;
         }
      }

      if (ends_with(std::string_view{file_name}, framework_suffix)) {
         report.categories[framework_index].file_count += 1;
      }

      if (ends_with(std::string_view{file_name}, loader_suffix)) {
         report.categories[loader_index].file_count += 1;
      }
   }

   std::error_code ec;
   const bool has_entry_point = fs::is_regular_file(root / entry_point_name, ec);

   report.categories.push_back(
      {.name = std::string{entry_point_name}, .file_count = has_entry_point ? 1u : 0u});

   return report;
}

void print_structure_report(const Structure_report& report)
{
   std::string listing = "Verifying deployable file structure:\n"s;

   for (const auto& category : report.categories) {
      if (category.present()) {
         listing += fmt::format("   Found {} {} file(s)\n", category.file_count,
                                category.name);
      }
      else {
         listing += fmt::format("   No {} files found\n", category.name);
      }
   }

   listing += fmt::format("Deployable files found: {}/{}\n", report.present_count(),
                          report.categories.size());

   synced_cout::print(listing);

   if (report.complete()) {
      synced_cout::print("Structure appears complete\n"s);
   }
   else {
      synced_cout::warning("Structure may be incomplete ({} of {} required categories)",
                           report.present_count(), report.min_categories);
   }
}
