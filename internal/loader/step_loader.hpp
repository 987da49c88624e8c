#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/step.hpp"

namespace upgrader::loader {

/*
  Step source parser.

  Layout rules:
    - flat directory, any subdirectory is a DirectoryLayoutError
    - hidden entries and entries without a .sql/.ddl extension are ignored
    - candidates are named "<digits>_<anything>"; file ids form 0..N-1

  File format:
    --- 0: create users
    CREATE TABLE users (...);
    --- 1: add email
    ALTER TABLE users ADD COLUMN email TEXT;

  Every non-blank byte must belong to a numbered step. Step ids within a
  file form 0..M-1 in order. Step bodies are trimmed.
*/

std::vector<model::MigrationFile> LoadMigrationFiles(const std::filesystem::path& directory);

// Flattened, sorted by (file_id, upgrader_id).
model::FullSequence LoadSteps(const std::filesystem::path& directory);

// Parses a single file body. file_name is used in error messages only.
std::vector<model::UpgraderStep> ParseSteps(std::int32_t file_id, std::string_view file_name, std::string_view content);

} // namespace upgrader::loader
