#include "chunk_naming.hpp"
#include "string_helpers.hpp"

#include <charconv>
#include <system_error>

auto split_part_name(std::string_view file_name) noexcept -> std::optional<Part_name>
{
   const auto marker_offset = file_name.rfind(part_marker);

   if (marker_offset == file_name.npos || marker_offset == 0) return std::nullopt;

   const auto digits = file_name.substr(marker_offset + part_marker.size());

   if (!string_is_digits(digits)) return std::nullopt;

   std::uint64_t index = 0;

   const auto [last, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), index);

   if (ec != std::errc{} || last != digits.data() + digits.size()) return std::nullopt;

   return Part_name{.base = file_name.substr(0, marker_offset), .index = index};
}

bool matches_chunk_pattern(std::string_view file_name, std::string_view extension) noexcept
{
   if (extension.empty()) return false;

   for (auto offset = file_name.find(extension); offset != file_name.npos;
        offset = file_name.find(extension, offset + 1)) {
      if (begins_with(file_name.substr(offset + extension.size()), part_marker)) {
         return true;
      }
   }

   return false;
}
