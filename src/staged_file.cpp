#include "staged_file.hpp"
#include "type_pun.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

Staged_file::Staged_file(fs::path target)
   : _target{std::move(target)}, _staged{fs::path{_target} += staged_extension}
{
   _out.open(_staged, std::ios::binary | std::ios::trunc);

   if (!_out) {
      throw std::runtime_error{
         fmt::format("Unable to create staged file '{}'", _staged.string())};
   }
}

Staged_file::~Staged_file()
{
   if (!_committed) discard();
}

void Staged_file::write(gsl::span<const std::byte> bytes)
{
   Expects(_out.is_open());

   _out.write(to_char_pointer(bytes.data()), gsl::narrow<std::streamsize>(bytes.size()));

   if (!_out) {
      throw std::runtime_error{
         fmt::format("Write to staged file '{}' failed", _staged.string())};
   }
}

void Staged_file::finish()
{
   if (!_out.is_open()) return;

   _out.flush();
   const bool good = _out.good();
   _out.close();

   if (!good || _out.fail()) {
      throw std::runtime_error{
         fmt::format("Unable to finish staged file '{}'", _staged.string())};
   }
}

auto Staged_file::size_on_disk() const -> std::uintmax_t
{
   return fs::file_size(_staged);
}

void Staged_file::commit()
{
   Expects(!_committed);

   finish();

   fs::rename(_staged, _target);

   _committed = true;
}

void Staged_file::discard() noexcept
{
   if (_out.is_open()) _out.close();

   std::error_code ec;
   fs::remove(_staged, ec);
}

auto Staged_file::staged_path() const noexcept -> const fs::path&
{
   return _staged;
}
