#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Normalizes the trees given on the command line and rejects any pair where
// one tree is the same as, or nested inside, the other. Trees are processed
// in parallel, so they must not share files.
auto resolve_input_roots(const std::vector<std::string>& inputs)
   -> std::vector<std::filesystem::path>;

bool is_within(const std::filesystem::path& inner, const std::filesystem::path& outer);
