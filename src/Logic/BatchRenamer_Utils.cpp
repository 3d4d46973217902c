#include "BatchRenamer.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// Formats 'number' with leading zeros to match a specified 'width'
std::string BatchRenamer::FormatNumber(long number, int width) {
  // Negative numbers typically aren't zero-padded in filename contexts
  if (number < 0) {
    return std::to_string(number);
  }
  if (width < 1) // Width 0 means the plain decimal rendering
  {
    width = 1;
  }
  std::stringstream ss;
  ss << std::setw(width) << std::setfill('0') << number;
  return ss.str();
}

// Case-insensitive string comparison
bool BatchRenamer::iequals(const std::string &a, const std::string &b) {
  if (a.length() != b.length()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char char_a, char char_b) {
                      return std::tolower(static_cast<unsigned char>(char_a)) ==
                             std::tolower(static_cast<unsigned char>(char_b));
                    });
}

// Converts string to lowercase
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Text from the last '.' of the file name onward; dotfiles such as ".bashrc"
// have no extension
std::string BatchRenamer::ExtractExtension(const fs::path &file) {
  const std::string name = file.filename().string();
  const std::size_t last_dot_pos = name.find_last_of('.');
  if (last_dot_pos == std::string::npos || last_dot_pos == 0) {
    return "";
  }
  return name.substr(last_dot_pos);
}

// Canonical form used for identity comparisons. Missing trailing components are
// allowed, so targets that do not exist yet still resolve.
fs::path BatchRenamer::ResolvePath(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (!ec) {
    return resolved;
  }
  resolved = fs::absolute(path, ec);
  if (!ec) {
    return resolved.lexically_normal();
  }
  return path.lexically_normal();
}

bool BatchRenamer::SamePath(const fs::path &a, const fs::path &b) {
  return ResolvePath(a) == ResolvePath(b);
}

// Local time rendered with a strftime-style 'format'
std::string BatchRenamer::CurrentTimestamp(const char *format) {
  auto now = std::chrono::system_clock::now();
  auto now_c = std::chrono::system_clock::to_time_t(now);
  std::tm now_tm = {};
#ifdef _WIN32
  localtime_s(&now_tm, &now_c); // Thread-safe time conversion
#else
  localtime_r(&now_c, &now_tm); // Thread-safe time conversion
#endif
  std::ostringstream oss;
  oss << std::put_time(&now_tm, format);
  return oss.str();
}

int BatchRenamer::GetPaddingWidth(const RenameConfig &config,
                                  std::size_t totalFiles) {
  switch (config.padding) {
  case PaddingMode::Auto:
    if (totalFiles < 10) {
      return 0;
    }
    if (totalFiles < 100) {
      return 2;
    }
    if (totalFiles < 1000) {
      return 3;
    }
    return 4;
  case PaddingMode::None:
    return 0;
  case PaddingMode::Fixed:
    return config.paddingWidth < 0 ? 0 : config.paddingWidth;
  }
  return 0;
}

// base name + separator + padded index + original extension
std::string BatchRenamer::SynthesizeName(const RenameConfig &config, long index,
                                         int width,
                                         const std::string &extension) {
  return config.baseName + config.separator + FormatNumber(index, width) +
         extension;
}

std::string BatchRenamer::SortMethodToString(SortMethod method) {
  switch (method) {
  case SortMethod::Alphabetical:
    return "alphabetical";
  case SortMethod::DateModified:
    return "date_modified";
  case SortMethod::DateModifiedDesc:
    return "date_modified_desc";
  case SortMethod::DateCreated:
    return "date_created";
  case SortMethod::DateCreatedDesc:
    return "date_created_desc";
  case SortMethod::SelectionOrder:
    return "selection_order";
  }
  return "alphabetical";
}

// Unknown keys fall back to alphabetical ordering
SortMethod BatchRenamer::ParseSortMethod(const std::string &key) {
  const std::string k = ToLower(key);
  if (k == "date_modified")
    return SortMethod::DateModified;
  if (k == "date_modified_desc")
    return SortMethod::DateModifiedDesc;
  if (k == "date_created")
    return SortMethod::DateCreated;
  if (k == "date_created_desc")
    return SortMethod::DateCreatedDesc;
  if (k == "selection_order")
    return SortMethod::SelectionOrder;
  return SortMethod::Alphabetical;
}

std::string BatchRenamer::ConflictStrategyToString(ConflictStrategy strategy) {
  switch (strategy) {
  case ConflictStrategy::Skip:
    return "skip";
  case ConflictStrategy::AddSuffix:
    return "add_suffix";
  case ConflictStrategy::AutoIncrement:
    return "auto_increment";
  case ConflictStrategy::Prompt:
    return "prompt";
  }
  return "prompt";
}

// Unknown keys leave conflicts unresolved, same as "prompt"
ConflictStrategy BatchRenamer::ParseConflictStrategy(const std::string &key) {
  const std::string k = ToLower(key);
  if (k == "skip")
    return ConflictStrategy::Skip;
  if (k == "add_suffix")
    return ConflictStrategy::AddSuffix;
  if (k == "auto_increment")
    return ConflictStrategy::AutoIncrement;
  return ConflictStrategy::Prompt;
}

std::string BatchRenamer::PaddingModeToString(PaddingMode mode, int width) {
  switch (mode) {
  case PaddingMode::Auto:
    return "auto";
  case PaddingMode::None:
    return "none";
  case PaddingMode::Fixed:
    return std::to_string(width < 0 ? 0 : width);
  }
  return "auto";
}

// Any non-negative integer key is a literal width; everything else falls back
// to auto
PaddingMode BatchRenamer::ParsePaddingMode(const std::string &key, int &width) {
  width = 0;
  const std::string k = ToLower(key);
  if (k == "auto")
    return PaddingMode::Auto;
  if (k == "none")
    return PaddingMode::None;
  if (k.empty() || k.find_first_not_of("0123456789") != std::string::npos)
    return PaddingMode::Auto;
  try {
    width = std::stoi(k);
  } catch (const std::out_of_range &) {
    return PaddingMode::Auto;
  }
  return PaddingMode::Fixed;
}
