#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

template<typename Char_type, typename Function,
         typename Char_traits = std::char_traits<Char_type>>
inline void for_each_substr(
   typename std::common_type<std::basic_string_view<Char_type, Char_traits>>::type string,
   const Char_type delimiter, Function function)
{
   for (auto offset = string.find(delimiter); (offset != string.npos);
        offset = string.find(delimiter)) {
      if (offset != 0) function(string.substr(0, offset));

      string.remove_prefix(offset + 1);
   }

   if (!string.empty()) function(string);
}

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool begins_with(
   std::basic_string_view<Char_t, Char_triats> string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   if (what.size() > string.size()) return false;

   return (string.substr(0, what.size()) == what);
}

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool ends_with(
   std::basic_string_view<Char_t, Char_triats> string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   if (what.size() > string.size()) return false;

   return (string.substr(string.size() - what.size()) == what);
}

constexpr bool string_is_digits(std::string_view string) noexcept
{
   if (string.empty()) return false;

   for (const auto c : string) {
      if (c < '0' || c > '9') return false;
   }

   return true;
}

inline auto format_megabytes(const std::uintmax_t bytes) -> std::string
{
   return fmt::format("{:.2f} MB", static_cast<double>(bytes) / 1024.0 / 1024.0);
}
