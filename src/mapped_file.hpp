#pragma once

#include <boost/iostreams/device/mapped_file.hpp>

#include <gsl/gsl>

#include <cstddef>
#include <filesystem>
#include <memory>

// Read-only view of a whole file. Empty files are valid and yield an empty span.
class Mapped_file {

public:
   Mapped_file() = default;
   explicit Mapped_file(const std::filesystem::path& path);

   gsl::span<const std::byte> bytes() const noexcept;

private:
   std::size_t _size = 0;
   std::shared_ptr<boost::iostreams::mapped_file_source> _file;
};
