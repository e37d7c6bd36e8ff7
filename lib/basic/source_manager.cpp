// recval/basic/source_manager.cpp - Source file and registry implementation
#include "recval/basic/source_manager.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace recval
{

namespace fs = std::filesystem;

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::optional<FileId> SourceRegistry::find(const fs::path & path) const
{
  const fs::path normalized = path.lexically_normal();
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].path == normalized) {
      return FileId(static_cast<uint32_t>(i));
    }
  }
  return std::nullopt;
}

FileId SourceRegistry::register_path(const fs::path & path)
{
  if (auto existing = find(path)) {
    return *existing;
  }

  Entry e;
  e.path = path.lexically_normal();
  entries_.push_back(std::move(e));
  return FileId(static_cast<uint32_t>(entries_.size() - 1));
}

FileId SourceRegistry::add_file(const fs::path & path, std::string content)
{
  const FileId id = register_path(path);
  Entry & e = entries_[id.value()];
  e.file.emplace(e.path, std::move(content));
  e.load_attempted = true;
  return id;
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_empty;
  if (!id.is_valid() || id.value() >= entries_.size()) {
    return k_empty;
  }
  return entries_[id.value()].path;
}

const SourceFile * SourceRegistry::get_file(FileId id) const
{
  if (!id.is_valid() || id.value() >= entries_.size()) {
    return nullptr;
  }

  const Entry & e = entries_[id.value()];
  if (!e.load_attempted) {
    e.load_attempted = true;
    std::ifstream in(e.path, std::ios::binary);
    if (in.is_open()) {
      std::stringstream buffer;
      buffer << in.rdbuf();
      e.file.emplace(e.path, buffer.str());
    }
  }

  return e.file ? &*e.file : nullptr;
}

}  // namespace recval
