#include "input_roots.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

auto normalize_root(const std::string& input) -> fs::path
{
   auto path = fs::weakly_canonical(fs::absolute(input)).lexically_normal();

   if (!path.has_filename() && path != path.root_path()) path = path.parent_path();

   return path;
}
}

bool is_within(const fs::path& inner, const fs::path& outer)
{
   const auto [outer_end, inner_end] =
      std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end());

   return outer_end == outer.end();
}

auto resolve_input_roots(const std::vector<std::string>& inputs) -> std::vector<fs::path>
{
   std::vector<fs::path> roots;
   roots.reserve(inputs.size());

   for (const auto& input : inputs) {
      auto root = normalize_root(input);

      for (const auto& other : roots) {
         if (is_within(root, other) || is_within(other, root)) {
            throw std::invalid_argument{
               fmt::format("Input directories overlap: '{}' and '{}'", other.string(),
                           root.string())};
         }
      }

      roots.push_back(std::move(root));
   }

   return roots;
}
