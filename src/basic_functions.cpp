#include "basic_functions.hpp"

#include "log.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace genui {
namespace {

static nlohmann::json Schema(nlohmann::json properties) {
  return {{"type", "object"}, {"properties", std::move(properties)}};
}

static nlohmann::json TypeSchema(const char* type) {
  return {{"type", type}};
}

static nlohmann::json AnySchema() {
  return nlohmann::json::object();
}

static bool Has(const nlohmann::json& args, const char* key) {
  return args.is_object() && args.contains(key);
}

static nlohmann::json Arg(const nlohmann::json& args, const char* key) {
  if (!Has(args, key)) return nullptr;
  return args.at(key);
}

// Truthiness used by the logic combinators.
static bool IsTruthy(const nlohmann::json& v) {
  if (v.is_boolean()) return v.get<bool>();
  return !v.is_null();
}

static std::string ToDisplayString(const nlohmann::json& v) {
  if (v.is_null()) return "";
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

static size_t Utf8Length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

class AndFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "and"; }
  std::string Description() const override { return "Performs a logical AND operation on a list of boolean values."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"values", TypeSchema("array")}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto values = Arg(args, "values");
    if (!values.is_array()) return false;
    for (const auto& v : values) {
      if (!IsTruthy(v)) return false;
    }
    return true;
  }
};

class OrFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "or"; }
  std::string Description() const override { return "Performs a logical OR operation on a list of boolean values."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"values", TypeSchema("array")}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto values = Arg(args, "values");
    if (!values.is_array()) return false;
    for (const auto& v : values) {
      if (IsTruthy(v)) return true;
    }
    return false;
  }
};

class NotFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "not"; }
  std::string Description() const override { return "Performs a logical NOT operation on a boolean value."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"value", AnySchema()}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    if (!Has(args, "value")) return false;
    return !IsTruthy(args.at("value"));
  }
};

class RequiredFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "required"; }
  std::string Description() const override { return "Checks that the value is not null, undefined, or empty."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"value", AnySchema()}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto v = Arg(args, "value");
    if (v.is_null()) return false;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    if (v.is_array() || v.is_object()) return !v.empty();
    return true;
  }
};

class RegexFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "regex"; }
  std::string Description() const override { return "Checks that the value matches a regular expression string."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"value", TypeSchema("string")}, {"pattern", TypeSchema("string")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    auto pattern = Arg(args, "pattern");
    if (!value.is_string() || !pattern.is_string()) return false;
    std::regex re;
    try {
      re = std::regex(pattern.get<std::string>(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw std::runtime_error("invalid regex pattern: " + pattern.get<std::string>() + ". " + e.what());
    }
    return std::regex_search(value.get<std::string>(), re);
  }
};

class LengthFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "length"; }
  std::string Description() const override { return "Checks string length constraints."; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"value", AnySchema()}, {"min", TypeSchema("integer")}, {"max", TypeSchema("integer")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    size_t length = 0;
    if (value.is_string()) {
      length = Utf8Length(value.get_ref<const std::string&>());
    } else if (value.is_array() || value.is_object()) {
      length = value.size();
    }

    if (Has(args, "min") || Has(args, "max")) {
      auto min = Arg(args, "min");
      auto max = Arg(args, "max");
      if (min.is_number() && static_cast<double>(length) < min.get<double>()) return false;
      if (max.is_number() && static_cast<double>(length) > max.get<double>()) return false;
      return true;
    }
    return length;
  }
};

class NumericFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "numeric"; }
  std::string Description() const override { return "Checks numeric range constraints."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"value", TypeSchema("number")}, {"min", TypeSchema("number")}, {"max", TypeSchema("number")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    if (!value.is_number()) return false;
    const double v = value.get<double>();
    auto min = Arg(args, "min");
    auto max = Arg(args, "max");
    if (min.is_number() && v < min.get<double>()) return false;
    if (max.is_number() && v > max.get<double>()) return false;
    return true;
  }
};

class EmailFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "email"; }
  std::string Description() const override { return "Checks that the value is a valid email address."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kBoolean; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"value", TypeSchema("string")}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    static const std::regex kEmail("^[^@]+@[^@]+\\.[^@]+$");
    auto value = Arg(args, "value");
    if (!value.is_string()) return false;
    return std::regex_match(value.get<std::string>(), kEmail);
  }
};

// Splits "Hello ${/user/name}" into literal text and placeholder paths.
struct TemplatePart {
  bool is_path = false;
  std::string text;
};

static std::vector<TemplatePart> ParseTemplate(const std::string& s) {
  std::vector<TemplatePart> parts;
  std::string literal;
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] == '\\' && i + 2 < s.size() && s[i + 1] == '$' && s[i + 2] == '{') {
      literal += "${";
      i += 3;
      continue;
    }
    if (s[i] == '$' && i + 1 < s.size() && s[i + 1] == '{') {
      auto close = s.find('}', i + 2);
      if (close == std::string::npos) break;
      std::string path = s.substr(i + 2, close - i - 2);
      while (!path.empty() && std::isspace(static_cast<unsigned char>(path.front()))) path.erase(path.begin());
      while (!path.empty() && std::isspace(static_cast<unsigned char>(path.back()))) path.pop_back();
      if (!literal.empty()) parts.push_back({false, std::move(literal)});
      literal.clear();
      parts.push_back({true, std::move(path)});
      i = close + 1;
      continue;
    }
    literal += s[i++];
  }
  if (i < s.size()) literal += s.substr(i);
  if (!literal.empty()) parts.push_back({false, std::move(literal)});
  return parts;
}

class FormatStringFunction : public ClientFunction {
 public:
  std::string Name() const override { return "formatString"; }
  std::string Description() const override {
    return "Interpolates ${path} placeholders with values from the data model. "
           "The result updates whenever a referenced value changes.";
  }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kString; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"value", TypeSchema("string")}}); }

  ValueStream Execute(const nlohmann::json& args, const ExecutionContext& context) const override {
    auto value = Arg(args, "value");
    if (!value.is_string()) return ValueStream::Of(ToDisplayString(value));

    auto parts = ParseTemplate(value.get<std::string>());
    std::vector<ValueStream> sources;
    for (const auto& p : parts) {
      if (p.is_path) sources.push_back(context.Watch(DataPath(p.text)));
    }
    if (sources.empty()) {
      std::string out;
      for (const auto& p : parts) out += p.text;
      return ValueStream::Of(out);
    }

    return ValueStream::CombineLatest(std::move(sources)).Map([parts](const nlohmann::json& values) {
      std::string out;
      size_t next = 0;
      for (const auto& p : parts) {
        if (p.is_path) {
          out += ToDisplayString(values.at(next++));
        } else {
          out += p.text;
        }
      }
      return nlohmann::json(out);
    });
  }
};

static std::string GroupThousands(const std::string& digits) {
  std::string out;
  const size_t n = digits.size();
  for (size_t i = 0; i < n; i++) {
    if (i > 0 && (n - i) % 3 == 0) out += ',';
    out += digits[i];
  }
  return out;
}

// en-US decimal formatting: rounds to `max_frac` digits, then drops
// trailing zeros down to `min_frac`.
static std::string FormatDecimal(double v, int min_frac, int max_frac, bool grouping) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v < 0 ? "-\xE2\x88\x9E" : "\xE2\x88\x9E";

  char buf[512];
  std::snprintf(buf, sizeof(buf), "%.*f", max_frac, std::fabs(v));
  std::string s = buf;
  std::string int_part = s;
  std::string frac_part;
  auto dot = s.find('.');
  if (dot != std::string::npos) {
    int_part = s.substr(0, dot);
    frac_part = s.substr(dot + 1);
  }
  while (static_cast<int>(frac_part.size()) > min_frac && !frac_part.empty() && frac_part.back() == '0') {
    frac_part.pop_back();
  }

  bool nonzero = false;
  for (char c : int_part + frac_part) {
    if (c != '0') nonzero = true;
  }

  std::string out = (v < 0 && nonzero) ? "-" : "";
  out += grouping ? GroupThousands(int_part) : int_part;
  if (!frac_part.empty()) out += "." + frac_part;
  return out;
}

class FormatNumberFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "formatNumber"; }
  std::string Description() const override {
    return "Formats a number with the specified grouping and decimal precision.";
  }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kString; }
  nlohmann::json ArgumentSchema() const override {
    return Schema(
        {{"value", TypeSchema("number")}, {"decimalPlaces", TypeSchema("integer")}, {"useGrouping", TypeSchema("boolean")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    if (!value.is_number()) return ToDisplayString(value);

    int min_frac = 0;
    int max_frac = 3;
    auto places = Arg(args, "decimalPlaces");
    if (places.is_number()) {
      double d = places.get<double>();
      if (!(d >= 0)) d = 0;
      if (d > 20) d = 20;
      const int p = static_cast<int>(d);
      min_frac = p;
      max_frac = p;
    }
    bool grouping = true;
    auto use_grouping = Arg(args, "useGrouping");
    if (use_grouping.is_boolean()) grouping = use_grouping.get<bool>();

    return FormatDecimal(value.get<double>(), min_frac, max_frac, grouping);
  }
};

struct CurrencyInfo {
  const char* code;
  const char* symbol;
  int decimals;
};

static const CurrencyInfo kCurrencies[] = {
    {"USD", "$", 2},
    {"EUR", "\xE2\x82\xAC", 2},
    {"GBP", "\xC2\xA3", 2},
    {"JPY", "\xC2\xA5", 0},
    {"INR", "\xE2\x82\xB9", 2},
    {"CNY", "\xC2\xA5", 2},
};

class FormatCurrencyFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "formatCurrency"; }
  std::string Description() const override { return "Formats a number as a currency string."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kString; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"value", TypeSchema("number")}, {"currencyCode", TypeSchema("string")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    auto code = Arg(args, "currencyCode");
    if (!value.is_number() || !code.is_string()) return ToDisplayString(value);

    std::string upper = code.get<std::string>();
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    std::string symbol = upper;
    int decimals = 2;
    for (const auto& info : kCurrencies) {
      if (upper == info.code) {
        symbol = info.symbol;
        decimals = info.decimals;
        break;
      }
    }

    const double v = value.get<double>();
    std::string digits = FormatDecimal(std::fabs(v), decimals, decimals, true);
    bool nonzero = false;
    for (char c : digits) {
      if (c >= '1' && c <= '9') nonzero = true;
    }
    return std::string(v < 0 && nonzero ? "-" : "") + symbol + digits;
  }
};

struct CivilTime {
  int64_t year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int weekday = 4;  // 0 = Sunday
};

static int64_t DaysFromCivil(int64_t y, int m, int d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

static CivilTime CivilFromEpochMillis(int64_t ms) {
  int64_t secs = ms / 1000;
  if (ms % 1000 < 0) secs--;
  int64_t days = secs / 86400;
  int64_t rem = secs % 86400;
  if (rem < 0) {
    rem += 86400;
    days--;
  }

  CivilTime t;
  t.hour = static_cast<int>(rem / 3600);
  t.minute = static_cast<int>(rem % 3600 / 60);
  t.second = static_cast<int>(rem % 60);
  t.weekday = static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);

  const int64_t z = days + 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  t.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  t.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  t.year = yoe + era * 400 + (t.month <= 2);
  return t;
}

// Accepts YYYY-MM-DD with an optional time, fraction and zone offset.
// Values without a zone are taken as UTC.
static std::optional<int64_t> ParseIsoMillis(const std::string& s) {
  static const std::regex kIso(
      "^\\s*([+-]?\\d{4,6})-(\\d{2})-(\\d{2})"
      "(?:[T ](\\d{2}):(\\d{2})(?::(\\d{2})(?:[.,](\\d{1,9}))?)?)?"
      "\\s*(Z|z|[+-]\\d{2}(?::?\\d{2})?)?\\s*$");
  std::smatch m;
  if (!std::regex_match(s, m, kIso)) return std::nullopt;

  const int64_t year = std::stoll(m[1].str());
  const int month = std::stoi(m[2].str());
  const int day = std::stoi(m[3].str());
  if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
  const int hour = m[4].matched ? std::stoi(m[4].str()) : 0;
  const int minute = m[5].matched ? std::stoi(m[5].str()) : 0;
  const int second = m[6].matched ? std::stoi(m[6].str()) : 0;
  if (hour > 24 || minute > 59 || second > 59) return std::nullopt;
  int millis = 0;
  if (m[7].matched) {
    std::string frac = m[7].str().substr(0, 3);
    while (frac.size() < 3) frac += '0';
    millis = std::stoi(frac);
  }

  int64_t offset_minutes = 0;
  if (m[8].matched) {
    std::string zone = m[8].str();
    if (zone != "Z" && zone != "z") {
      const int sign = zone[0] == '-' ? -1 : 1;
      std::string digits;
      for (char c : zone) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
      }
      int oh = std::stoi(digits.substr(0, 2));
      int om = digits.size() >= 4 ? std::stoi(digits.substr(2, 2)) : 0;
      offset_minutes = sign * (oh * 60 + om);
    }
  }

  const int64_t days = DaysFromCivil(year, month, day);
  const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  return secs * 1000 + millis;
}

static const char* const kMonthNames[] = {"January", "February", "March",     "April",   "May",      "June",
                                          "July",    "August",   "September", "October", "November", "December"};
static const char* const kDayNames[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

static std::string Pad(int64_t v, size_t width) {
  std::string s = std::to_string(v < 0 ? -v : v);
  while (s.size() < width) s.insert(s.begin(), '0');
  return v < 0 ? "-" + s : s;
}

static std::string FormatCivil(const CivilTime& t, const std::string& pattern) {
  std::string out;
  size_t i = 0;
  while (i < pattern.size()) {
    const char c = pattern[i];
    if (c == '\'') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '\'') {
        out += '\'';
        i += 2;
        continue;
      }
      auto close = pattern.find('\'', i + 1);
      if (close == std::string::npos) close = pattern.size();
      out += pattern.substr(i + 1, close - i - 1);
      i = close + 1;
      continue;
    }
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      out += c;
      i++;
      continue;
    }
    size_t n = 1;
    while (i + n < pattern.size() && pattern[i + n] == c) n++;
    i += n;
    switch (c) {
      case 'y':
        out += n == 2 ? Pad(t.year % 100, 2) : Pad(t.year, n);
        break;
      case 'M':
        if (n >= 4) {
          out += kMonthNames[t.month - 1];
        } else if (n == 3) {
          out += std::string(kMonthNames[t.month - 1]).substr(0, 3);
        } else {
          out += Pad(t.month, n);
        }
        break;
      case 'd':
        out += Pad(t.day, n);
        break;
      case 'E':
        out += n >= 4 ? std::string(kDayNames[t.weekday]) : std::string(kDayNames[t.weekday]).substr(0, 3);
        break;
      case 'H':
        out += Pad(t.hour, n);
        break;
      case 'h': {
        int h12 = t.hour % 12;
        out += Pad(h12 == 0 ? 12 : h12, n);
        break;
      }
      case 'm':
        out += Pad(t.minute, n);
        break;
      case 's':
        out += Pad(t.second, n);
        break;
      case 'a':
        out += t.hour < 12 ? "AM" : "PM";
        break;
      default:
        out += std::string(n, c);
        break;
    }
  }
  return out;
}

class FormatDateFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "formatDate"; }
  std::string Description() const override { return "Formats a timestamp into a string using a pattern."; }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kString; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"value", AnySchema()}, {"pattern", TypeSchema("string")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto value = Arg(args, "value");
    auto pattern = Arg(args, "pattern");

    std::optional<int64_t> millis;
    if (value.is_string()) {
      millis = ParseIsoMillis(value.get<std::string>());
    } else if (value.is_number_unsigned()) {
      const auto u = value.get<uint64_t>();
      if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) millis = static_cast<int64_t>(u);
    } else if (value.is_number_integer()) {
      millis = value.get<int64_t>();
    }
    if (!millis || !pattern.is_string()) {
      if (value.is_null()) return nullptr;
      return ToDisplayString(value);
    }
    return FormatCivil(CivilFromEpochMillis(*millis), pattern.get<std::string>());
  }
};

class PluralizeFunction : public SynchronousClientFunction {
 public:
  std::string Name() const override { return "pluralize"; }
  std::string Description() const override {
    return "Returns the 'zero', 'one' or 'other' string depending on count. Requires an 'other' fallback.";
  }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kString; }
  nlohmann::json ArgumentSchema() const override {
    return Schema({{"count", TypeSchema("number")},
                   {"zero", TypeSchema("string")},
                   {"one", TypeSchema("string")},
                   {"other", TypeSchema("string")}});
  }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto count = Arg(args, "count");
    if (!count.is_number()) return "";
    const double n = count.get<double>();
    if (n == 0 && Has(args, "zero")) return args.at("zero");
    if (n == 1 && Has(args, "one")) return args.at("one");
    auto other = Arg(args, "other");
    if (other.is_null()) return "";
    return other;
  }
};

class OpenUrlFunction : public SynchronousClientFunction {
 public:
  explicit OpenUrlFunction(UrlLauncher launcher) : launcher_(std::move(launcher)) {}

  std::string Name() const override { return "openUrl"; }
  std::string Description() const override {
    return "Opens the specified URL in a browser or handler. This function has no return value.";
  }
  FunctionReturnType ReturnType() const override { return FunctionReturnType::kVoid; }
  nlohmann::json ArgumentSchema() const override { return Schema({{"url", TypeSchema("string")}}); }

 protected:
  nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext&) const override {
    auto url = Arg(args, "url");
    if (!url.is_string()) return false;
    const auto& s = url.get_ref<const std::string&>();
    if (s.empty()) return false;
    for (char c : s) {
      if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    if (LogEnabled()) std::cout << "[open-url] url=" << TruncateForLog(s, 500) << "\n";
    if (launcher_) launcher_(s);
    return true;
  }

 private:
  UrlLauncher launcher_;
};

}  // namespace

void RegisterBasicFunctions(FunctionRegistry* registry, UrlLauncher launcher) {
  if (!registry) return;
  registry->Register(std::make_unique<RequiredFunction>());
  registry->Register(std::make_unique<RegexFunction>());
  registry->Register(std::make_unique<LengthFunction>());
  registry->Register(std::make_unique<NumericFunction>());
  registry->Register(std::make_unique<EmailFunction>());
  registry->Register(std::make_unique<FormatStringFunction>());
  registry->Register(std::make_unique<OpenUrlFunction>(std::move(launcher)));
  registry->Register(std::make_unique<FormatNumberFunction>());
  registry->Register(std::make_unique<FormatCurrencyFunction>());
  registry->Register(std::make_unique<FormatDateFunction>());
  registry->Register(std::make_unique<PluralizeFunction>());
  registry->Register(std::make_unique<AndFunction>());
  registry->Register(std::make_unique<OrFunction>());
  registry->Register(std::make_unique<NotFunction>());
}

}  // namespace genui
