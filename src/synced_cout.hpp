#pragma once

#include <fmt/format.h>

#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

namespace synced_cout {

namespace detail {
inline std::mutex& cout_mutex() noexcept
{
   static std::mutex mutex;

   return mutex;
}

template<typename Arg>
inline void write(Arg&& arg)
{
   std::cout << std::forward<Arg>(arg);
}

template<typename... Args>
inline void print_prefixed(std::string_view prefix, std::string_view format_str,
                           Args&&... args)
{
   const auto line = fmt::format("{}{}\n", prefix,
                                 fmt::format(fmt::runtime(format_str),
                                             std::forward<Args>(args)...));

   std::lock_guard<std::mutex> lock{cout_mutex()};

   std::cout << line;
}
}

template<typename... Args>
inline void print(Args&&... args)
{
   std::lock_guard<std::mutex> lock{detail::cout_mutex()};

   [[maybe_unused]] const bool dummy_list[] = {
      false, (detail::write(std::forward<Args>(args)), false)...};
}

// Each of these writes one whole line, so lines from concurrent trees never interleave.

template<typename... Args>
inline void info(std::string_view format_str, Args&&... args)
{
   detail::print_prefixed("Info: ", format_str, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warning(std::string_view format_str, Args&&... args)
{
   detail::print_prefixed("Warning: ", format_str, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(std::string_view format_str, Args&&... args)
{
   detail::print_prefixed("Error: ", format_str, std::forward<Args>(args)...);
}
}
