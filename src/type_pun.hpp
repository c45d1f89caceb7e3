#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <string_view>
#include <type_traits>

template<typename Type>
inline auto to_char_pointer(const Type* const pointer) noexcept -> const char*
{
   return reinterpret_cast<const char*>(pointer);
}

template<typename Type>
inline auto to_byte_pointer(const Type* const pointer) noexcept -> const std::byte*
{
   return reinterpret_cast<const std::byte*>(pointer);
}

inline auto view_string_as_bytes(std::string_view string) noexcept
   -> gsl::span<const std::byte>
{
   return {to_byte_pointer(string.data()), string.size()};
}
