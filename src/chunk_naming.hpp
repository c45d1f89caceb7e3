#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

constexpr std::string_view part_marker{".part"};

struct Part_name {
   std::string_view base;
   std::uint64_t index = 0;
};

// Splits "<base>.part<N>" into its base and numeric index. N is any run of
// decimal digits that fits in 64 bits; anything else is not a part name.
auto split_part_name(std::string_view file_name) noexcept -> std::optional<Part_name>;

// Equivalent of the shell pattern "*<extension>.part*".
bool matches_chunk_pattern(std::string_view file_name,
                           std::string_view extension) noexcept;
