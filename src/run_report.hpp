#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// "key=value" lines handed to the invoking CI step, in insertion order.
class Run_report {
public:
   void set(std::string_view key, std::string value);

   void set(std::string_view key, const char* value) = delete;

   void set(std::string_view key, bool value);

   void set(std::string_view key, std::uintmax_t value);

   auto str() const -> std::string;

   // Appends to the file, creating it if needed, as CI output files expect.
   void append_to(const std::filesystem::path& path) const;

private:
   std::vector<std::pair<std::string, std::string>> _entries;
};
