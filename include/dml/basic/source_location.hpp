// dml/basic/source_location.hpp - Source files and line/column locations
//
// Model sources arrive already parsed, so locations are stored as
// (file, line, column) triples instead of byte offsets.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dml
{

// ============================================================================
// FileId
// ============================================================================

/**
 * Strong index of a file registered in a SourceRegistry.
 */
struct FileId
{
  uint32_t value = UINT32_MAX;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != UINT32_MAX; }

  friend constexpr bool operator==(FileId a, FileId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(FileId a, FileId b) noexcept { return a.value != b.value; }
};

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * A position in a model source. Line and column are 1-based; 0 means unknown.
 */
struct SourceLocation
{
  FileId file;
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return file.is_valid(); }
  [[nodiscard]] constexpr bool has_position() const noexcept { return line != 0; }

  friend constexpr bool operator==(const SourceLocation & a, const SourceLocation & b) noexcept
  {
    return a.file == b.file && a.line == b.line && a.column == b.column;
  }
  friend constexpr bool operator!=(const SourceLocation & a, const SourceLocation & b) noexcept
  {
    return !(a == b);
  }
  friend constexpr bool operator<(const SourceLocation & a, const SourceLocation & b) noexcept
  {
    if (a.file.value != b.file.value) return a.file.value < b.file.value;
    if (a.line != b.line) return a.line < b.line;
    return a.column < b.column;
  }
};

// ============================================================================
// SourceFile / SourceRegistry
// ============================================================================

/**
 * A registered source file. `content` is optional and only used to print
 * source snippets for diagnostics.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] const std::string & content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Line text without the trailing newline (0-based index). Empty if out of range.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

class SourceRegistry
{
public:
  /**
   * Register a file. Registering the same path again returns the existing id
   * and replaces its content when new content is given.
   */
  FileId add_file(const std::filesystem::path & path, std::string content = {});

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] std::filesystem::path get_path(FileId id) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<SourceFile> files_;
};

}  // namespace dml

namespace std
{
template <>
struct hash<dml::FileId>
{
  size_t operator()(dml::FileId id) const noexcept { return hash<uint32_t>{}(id.value); }
};
}  // namespace std
