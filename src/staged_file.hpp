#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>

constexpr std::string_view staged_extension{".tmp"};

// Output written beside its target as "<target>.tmp". The staged file is
// removed on destruction unless commit() moved it onto the target.
class Staged_file {
public:
   explicit Staged_file(std::filesystem::path target);

   Staged_file(const Staged_file&) = delete;
   Staged_file& operator=(const Staged_file&) = delete;
   Staged_file(Staged_file&&) = delete;
   Staged_file& operator=(Staged_file&&) = delete;

   ~Staged_file();

   void write(gsl::span<const std::byte> bytes);

   // Flushes and closes the stream; throws if any write failed.
   void finish();

   auto size_on_disk() const -> std::uintmax_t;

   void commit();

   auto staged_path() const noexcept -> const std::filesystem::path&;

private:
   void discard() noexcept;

   const std::filesystem::path _target;
   const std::filesystem::path _staged;
   std::ofstream _out;
   bool _committed = false;
};
