#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace genui {

struct PathSegment {
  enum class Kind { kField, kIndex };

  Kind kind = Kind::kField;
  std::string field;
  size_t index = 0;

  static PathSegment Field(std::string name);
  static PathSegment Index(size_t i);

  bool IsField() const { return kind == Kind::kField; }
  bool IsIndex() const { return kind == Kind::kIndex; }

  bool operator==(const PathSegment& other) const;
  bool operator!=(const PathSegment& other) const { return !(*this == other); }
};

// Immutable address inside a surface's data document.
// Syntax is `/a/b[0]/c`. A leading `/` makes the path absolute; the empty
// string and `/` both address the whole document.
class DataPath {
 public:
  DataPath() = default;
  DataPath(const std::string& text);  // NOLINT(google-explicit-constructor)
  DataPath(const char* text);         // NOLINT(google-explicit-constructor)
  DataPath(std::vector<PathSegment> segments, bool absolute);

  static DataPath Root();

  const std::vector<PathSegment>& Segments() const { return segments_; }
  bool IsAbsolute() const { return absolute_; }
  bool IsRoot() const { return segments_.empty(); }
  size_t Size() const { return segments_.size(); }

  // Concatenates `other` onto this path regardless of whether `other` is absolute.
  DataPath Join(const DataPath& other) const;

  // Returns this path when absolute, otherwise `base` joined with it.
  DataPath Resolve(const DataPath& base) const;

  DataPath Parent() const;

  // True when every segment of this path is a leading segment of `other`.
  bool IsPrefixOf(const DataPath& other) const;

  std::string ToString() const;

  bool operator==(const DataPath& other) const;
  bool operator!=(const DataPath& other) const { return !(*this == other); }

 private:
  std::vector<PathSegment> segments_;
  bool absolute_ = true;
};

}  // namespace genui
