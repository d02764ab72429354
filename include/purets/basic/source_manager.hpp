// purets/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace purets
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source file. Line and column
 * information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  /// Create a location from byte offset
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>(SourceLocation other) const noexcept
  {
    return offset_ > other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(SourceLocation other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of source code defined by start and end locations.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return start_.is_invalid() || end_.is_invalid();
  }

  /// Check if a location is contained within this range
  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc >= start_ && loc < end_;
  }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.start_ >= start_ && other.end_ <= end_;
  }

  /// Get the size in bytes
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile - One file's text and line table
// ============================================================================

/**
 * Owns the content of a single TypeScript source file.
 *
 * Line start offsets are pre-computed so that byte offsets can be converted
 * to line/column positions with a binary search.
 */
class SourceFile
{
public:
  SourceFile() = default;

  /// Initialize with source content only (no file path)
  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & get_path() const noexcept { return path_; }

  [[nodiscard]] std::string_view get_content() const noexcept { return content_; }

  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept
  {
    return get_line_column(loc.get_offset());
  }

  /// Get the byte offset of a line start (0-indexed line number)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept
  {
    if (line_index >= line_offsets_.size()) {
      return static_cast<uint32_t>(content_.size());
    }
    return line_offsets_[line_index];
  }

  /// Byte range covering the text of a line (0-indexed), without the newline
  [[nodiscard]] SourceRange get_line_range(uint32_t line_index) const noexcept;

  /// Get the content of a specific line (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by range
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace purets
