#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <cstdint>
#include <string>

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320), fed incrementally.
class Crc32 {
public:
   void update(gsl::span<const std::byte> bytes) noexcept;

   auto value() const noexcept -> std::uint32_t;

   auto hex() const -> std::string;

private:
   std::uint32_t _crc = 0xffffffffu;
};

auto crc32_of(gsl::span<const std::byte> bytes) noexcept -> std::uint32_t;
