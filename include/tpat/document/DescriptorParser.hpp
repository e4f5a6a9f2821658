#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>

#include <filesystem>
#include <string_view>

namespace TP {

// Builds a validated Document from descriptor JSON. Unknown keys, wrong types and
// missing required fields are structural errors; keys newer than the declared
// `version` and conflicting keys are semantic errors. Relative overlay paths are
// later resolved against `base_directory`.
[[nodiscard]] auto ParseDescriptor(std::string_view text, std::filesystem::path base_directory = {})
    -> Expected<Document>;

[[nodiscard]] auto LoadDescriptor(std::filesystem::path const& path) -> Expected<Document>;

} // namespace TP
