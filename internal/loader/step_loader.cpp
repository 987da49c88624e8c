#include "step_loader.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace upgrader::loader {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kHeaderPrefix = "--- ";

struct Candidate {
  std::int32_t file_id = 0;
  fs::path     path;
};

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

std::optional<std::int32_t> ParseNumber(std::string_view digits) {
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), IsDigit)) {
    return std::nullopt;
  }

  std::int32_t value = 0;
  auto [ptr, ec]     = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

bool IsMigrationExtension(const fs::path& path) {
  const auto ext = util::ToLower(path.extension().string());
  return ext == ".sql" || ext == ".ddl";
}

std::int32_t ParseFileId(const std::string& file_name) {
  const auto underscore = file_name.find('_');
  if (underscore == std::string::npos || underscore == 0) {
    throw util::FileNamingError("File name must start with a number followed by '_': " + file_name);
  }

  auto id = ParseNumber(std::string_view(file_name).substr(0, underscore));
  if (!id) {
    throw util::FileNamingError("File name must start with a number followed by '_': " + file_name);
  }
  return *id;
}

std::vector<Candidate> ListCandidates(const fs::path& directory) {
  std::error_code ec;
  if (!fs::exists(directory, ec)) {
    throw util::DirectoryLayoutError("Folder does not exist: " + directory.string());
  }
  if (!fs::is_directory(directory, ec)) {
    throw util::DirectoryLayoutError("Path is not a directory: " + directory.string());
  }

  std::vector<Candidate> candidates;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    throw util::DirectoryLayoutError("Failed to list " + directory.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    if (entry.is_directory(ec)) {
      throw util::DirectoryLayoutError("Nested directory found: " + entry.path().string());
    }

    const auto name = entry.path().filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    if (!IsMigrationExtension(entry.path())) {
      continue;
    }

    candidates.push_back({ParseFileId(name), entry.path()});
  }

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.file_id != b.file_id) return a.file_id < b.file_id;
    return a.path.filename() < b.path.filename();
  });

  return candidates;
}

void ValidateFileSequence(const std::vector<Candidate>& candidates) {
  for (std::size_t idx = 0; idx < candidates.size(); ++idx) {
    const auto expected = static_cast<std::int32_t>(idx);
    const auto& c       = candidates[idx];
    if (c.file_id == expected) {
      continue;
    }
    if (c.file_id < expected) {
      throw util::FileSequenceError("Duplicate file ID " + std::to_string(c.file_id) + " found: " + c.path.filename().string());
    }
    throw util::FileSequenceError("Missing file ID " + std::to_string(expected) + ". Found " + std::to_string(c.file_id) + " at " +
                                  c.path.filename().string());
  }
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::DirectoryLayoutError("Failed to read file " + path.string());
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

struct Header {
  std::int32_t upgrader_id = 0;
  std::string  description;
};

// "--- <digits>: <description>"
Header ParseHeader(std::string_view line, std::string_view file_name) {
  auto rest  = line.substr(kHeaderPrefix.size());
  auto colon = rest.find(':');
  if (colon == std::string_view::npos || colon + 1 >= rest.size() || rest[colon + 1] != ' ') {
    throw util::StepHeaderError("Invalid upgrader header format in file " + std::string(file_name) + ": " + std::string(line));
  }

  auto id = ParseNumber(rest.substr(0, colon));
  if (!id) {
    throw util::StepHeaderError("Invalid upgrader ID format in file " + std::string(file_name) + ": " + std::string(line));
  }

  return {*id, util::Trim(rest.substr(colon + 2))};
}

} // namespace

std::vector<model::UpgraderStep> ParseSteps(std::int32_t file_id, std::string_view file_name, std::string_view content) {
  std::vector<model::UpgraderStep> steps;
  std::optional<model::UpgraderStep> current;
  std::string body;
  std::int32_t expected_id = 0;

  auto flush = [&]() {
    if (current) {
      current->sql_text = util::Trim(body);
      steps.push_back(std::move(*current));
      current.reset();
    } else if (!util::IsBlank(body)) {
      throw util::StepHeaderError("SQL found before the first step header in file " + std::string(file_name));
    }
    body.clear();
  };

  std::size_t pos = 0;
  while (pos <= content.size()) {
    auto end = content.find('\n', pos);
    if (end == std::string_view::npos) end = content.size();

    auto line = content.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (line.substr(0, kHeaderPrefix.size()) == kHeaderPrefix) {
      auto header = ParseHeader(line, file_name);
      if (header.upgrader_id != expected_id) {
        throw util::StepSequenceError("Invalid upgrader sequence in file " + std::string(file_name) + ". Expected ID " +
                                      std::to_string(expected_id) + ", found " + std::to_string(header.upgrader_id));
      }
      flush();

      model::UpgraderStep step;
      step.file_id     = file_id;
      step.upgrader_id = header.upgrader_id;
      step.description = std::move(header.description);
      current          = std::move(step);
      ++expected_id;
    } else {
      body.append(line);
      body.push_back('\n');
    }

    if (end == content.size()) break;
    pos = end + 1;
  }

  flush();
  return steps;
}

std::vector<model::MigrationFile> LoadMigrationFiles(const fs::path& directory) {
  auto candidates = ListCandidates(directory);
  ValidateFileSequence(candidates);

  std::vector<model::MigrationFile> files;
  files.reserve(candidates.size());
  for (const auto& c : candidates) {
    model::MigrationFile file;
    file.file_id   = c.file_id;
    file.file_name = c.path.filename().string();
    file.steps     = ParseSteps(c.file_id, file.file_name, ReadFile(c.path));

    UPGRADER_LOG_DEBUG("Loaded migration file",
                       {StringField("file", file.file_name), IntField("file_id", file.file_id), IntField("steps", static_cast<std::int64_t>(file.steps.size()))});
    files.push_back(std::move(file));
  }
  return files;
}

model::FullSequence LoadSteps(const fs::path& directory) {
  model::FullSequence sequence;
  for (auto& file : LoadMigrationFiles(directory)) {
    for (auto& step : file.steps) {
      sequence.push_back(std::move(step));
    }
  }
  return sequence;
}

} // namespace upgrader::loader
