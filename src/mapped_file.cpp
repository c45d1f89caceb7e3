#include "mapped_file.hpp"

#include <fmt/format.h>

#include <exception>
#include <stdexcept>

namespace fs = std::filesystem;

Mapped_file::Mapped_file(const fs::path& path)
{
   if (!fs::is_regular_file(path)) {
      throw std::runtime_error{fmt::format("Not a regular file '{}'", path.string())};
   }

   // Boost refuses to map zero-length files.
   if (fs::file_size(path) == 0) return;

   boost::iostreams::mapped_file_params parameters;
   parameters.path = path.string();
   parameters.flags = boost::iostreams::mapped_file::mapmode::readonly;
   parameters.offset = static_cast<boost::iostreams::stream_offset>(0);

   auto file = std::make_shared<boost::iostreams::mapped_file_source>();

   try {
      file->open(parameters);
   }
   catch (std::exception& e) {
      throw std::runtime_error{
         fmt::format("Unable to map '{}': {}", path.string(), e.what())};
   }

   if (!file->is_open()) {
      throw std::runtime_error{fmt::format("Unable to map '{}'", path.string())};
   }

   _size = file->size();
   _file = std::move(file);
}

gsl::span<const std::byte> Mapped_file::bytes() const noexcept
{
   if (!_file) return {};

   return {reinterpret_cast<const std::byte*>(_file->data()), _size};
}
