#include "checksum.hpp"

#include <fmt/format.h>

#include <array>

namespace {

constexpr std::uint32_t polynomial = 0xedb88320u;

constexpr auto make_crc32_table() noexcept -> std::array<std::uint32_t, 256>
{
   std::array<std::uint32_t, 256> table{};

   for (std::uint32_t i = 0; i < table.size(); ++i) {
      std::uint32_t value = i;

      for (int bit = 0; bit < 8; ++bit) {
         value = (value & 1u) ? ((value >> 1) ^ polynomial) : (value >> 1);
      }

      table[i] = value;
   }

   return table;
}

constexpr auto crc32_table = make_crc32_table();
}

void Crc32::update(gsl::span<const std::byte> bytes) noexcept
{
   for (const auto byte : bytes) {
      const auto index = (_crc ^ std::to_integer<std::uint32_t>(byte)) & 0xffu;

      _crc = (_crc >> 8) ^ crc32_table[index];
   }
}

auto Crc32::value() const noexcept -> std::uint32_t
{
   return _crc ^ 0xffffffffu;
}

auto Crc32::hex() const -> std::string
{
   return fmt::format("{:08x}", value());
}

auto crc32_of(gsl::span<const std::byte> bytes) noexcept -> std::uint32_t
{
   Crc32 crc;
   crc.update(bytes);

   return crc.value();
}
