#include "data_path.hpp"

#include <cctype>
#include <utility>

namespace genui {
namespace {

static bool ParseIndex(const std::string& digits, size_t* out) {
  if (digits.empty() || digits.size() > 18) return false;
  size_t v = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + static_cast<size_t>(c - '0');
  }
  *out = v;
  return true;
}

// Splits `a[0][1]` into field `a` and indexes 0, 1. Returns false when the
// trailing bracket groups are not all non-negative integers.
static bool SplitIndexedToken(const std::string& token, std::string* field, std::vector<size_t>* indexes) {
  std::vector<size_t> rev;
  size_t end = token.size();
  while (end > 0 && token[end - 1] == ']') {
    auto open = token.rfind('[', end - 1);
    if (open == std::string::npos) return false;
    size_t idx = 0;
    if (!ParseIndex(token.substr(open + 1, end - open - 2), &idx)) return false;
    rev.push_back(idx);
    end = open;
  }
  if (rev.empty()) return false;
  *field = token.substr(0, end);
  indexes->assign(rev.rbegin(), rev.rend());
  return true;
}

static std::vector<PathSegment> ParseSegments(const std::string& text) {
  std::vector<PathSegment> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t slash = text.find('/', start);
    if (slash == std::string::npos) slash = text.size();
    std::string token = text.substr(start, slash - start);
    start = slash + 1;
    if (token.empty()) continue;

    std::string field;
    std::vector<size_t> indexes;
    if (SplitIndexedToken(token, &field, &indexes)) {
      if (!field.empty()) out.push_back(PathSegment::Field(std::move(field)));
      for (auto i : indexes) out.push_back(PathSegment::Index(i));
    } else {
      out.push_back(PathSegment::Field(std::move(token)));
    }
  }
  return out;
}

}  // namespace

PathSegment PathSegment::Field(std::string name) {
  PathSegment s;
  s.kind = Kind::kField;
  s.field = std::move(name);
  return s;
}

PathSegment PathSegment::Index(size_t i) {
  PathSegment s;
  s.kind = Kind::kIndex;
  s.index = i;
  return s;
}

bool PathSegment::operator==(const PathSegment& other) const {
  if (kind != other.kind) return false;
  return kind == Kind::kField ? field == other.field : index == other.index;
}

DataPath::DataPath(const std::string& text)
    : segments_(ParseSegments(text)), absolute_(!text.empty() && text.front() == '/') {}

DataPath::DataPath(const char* text) : DataPath(std::string(text ? text : "")) {}

DataPath::DataPath(std::vector<PathSegment> segments, bool absolute)
    : segments_(std::move(segments)), absolute_(absolute) {}

DataPath DataPath::Root() {
  return DataPath({}, true);
}

DataPath DataPath::Join(const DataPath& other) const {
  std::vector<PathSegment> joined = segments_;
  joined.insert(joined.end(), other.segments_.begin(), other.segments_.end());
  return DataPath(std::move(joined), absolute_);
}

DataPath DataPath::Resolve(const DataPath& base) const {
  if (absolute_) return *this;
  return base.Join(*this);
}

DataPath DataPath::Parent() const {
  if (segments_.empty()) return *this;
  std::vector<PathSegment> parent(segments_.begin(), segments_.end() - 1);
  return DataPath(std::move(parent), absolute_);
}

bool DataPath::IsPrefixOf(const DataPath& other) const {
  if (segments_.size() > other.segments_.size()) return false;
  for (size_t i = 0; i < segments_.size(); i++) {
    if (segments_[i] != other.segments_[i]) return false;
  }
  return true;
}

std::string DataPath::ToString() const {
  std::string out;
  for (size_t i = 0; i < segments_.size(); i++) {
    const auto& s = segments_[i];
    if (s.IsField()) {
      if (i > 0 || absolute_) out += '/';
      out += s.field;
    } else {
      if (i == 0 && absolute_) out += '/';
      out += '[' + std::to_string(s.index) + ']';
    }
  }
  if (out.empty() && absolute_) out = "/";
  return out;
}

bool DataPath::operator==(const DataPath& other) const {
  return absolute_ == other.absolute_ && segments_ == other.segments_;
}

}  // namespace genui
