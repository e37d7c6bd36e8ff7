// recval/basic/source_manager.hpp - Source files and locations of described declarations
//
// Model files describe declarations that live in some host source file. The
// locations carried by a model are line/column based, so ranges here store
// line information directly instead of byte offsets.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recval
{

// ============================================================================
// FileId
// ============================================================================

/**
 * Index of a file registered in a SourceRegistry.
 */
class FileId
{
public:
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value_ != other.value_;
  }
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value_ < other.value_;
  }

private:
  uint32_t value_ = k_invalid_value;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * A single-line range inside a registered file (1-indexed line and column).
 *
 * A range with line 0 is "unknown"; it still may name a file.
 */
struct SourceRange
{
  FileId file;
  uint32_t line = 0;
  uint32_t column = 0;
  uint32_t length = 0;

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file; }

  /// Check if the range points at a concrete line
  [[nodiscard]] constexpr bool is_valid() const noexcept { return file.is_valid() && line > 0; }

  /// Column one past the last character covered by the range
  [[nodiscard]] constexpr uint32_t end_column() const noexcept
  {
    return column + (length > 0 ? length : 1);
  }

  [[nodiscard]] constexpr bool operator<(const SourceRange & other) const noexcept
  {
    if (file != other.file) return file < other.file;
    if (line != other.line) return line < other.line;
    return column < other.column;
  }
};

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Content of one source file with a pre-computed line table.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line without its terminator (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Registry of files referenced by diagnostics.
 *
 * Files referenced by a model are registered by path only; their content is
 * read from disk the first time a printer asks for it. Files that cannot be
 * read are remembered as such and yield no snippet.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Register a path without reading it. Returns the existing id for a known path.
  FileId register_path(const std::filesystem::path & path);

  /// Register (or replace) a file with in-memory content.
  FileId add_file(const std::filesystem::path & path, std::string content);

  /// Path of a registered file (empty path for an invalid id)
  [[nodiscard]] const std::filesystem::path & get_path(FileId id) const noexcept;

  /// Content of a registered file, loading it on first use. nullptr if unreadable.
  [[nodiscard]] const SourceFile * get_file(FileId id) const;

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

private:
  struct Entry
  {
    std::filesystem::path path;
    mutable std::optional<SourceFile> file;
    mutable bool load_attempted = false;
  };

  [[nodiscard]] std::optional<FileId> find(const std::filesystem::path & path) const;

  std::vector<Entry> entries_;
};

}  // namespace recval
