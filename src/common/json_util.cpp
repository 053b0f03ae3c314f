#include "remotegate/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

namespace remotegate::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;

class FlatParser {
public:
  explicit FlatParser(const std::string &text) : text_(text) {}

  Result<JsonFlatMap> parse() {
    JsonFlatMap out;
    skip_ws();
    if (!consume('{')) {
      return Result<JsonFlatMap>::failure("expected '{'");
    }
    skip_ws();
    if (consume('}')) {
      return finish(std::move(out));
    }
    while (true) {
      skip_ws();
      std::string key;
      if (!parse_string(key)) {
        return Result<JsonFlatMap>::failure("expected member name at offset " +
                                            std::to_string(pos_));
      }
      skip_ws();
      if (!consume(':')) {
        return Result<JsonFlatMap>::failure("expected ':' at offset " + std::to_string(pos_));
      }
      skip_ws();
      if (peek() == '"') {
        std::string value;
        if (!parse_string(value)) {
          return Result<JsonFlatMap>::failure("unterminated string at offset " +
                                              std::to_string(pos_));
        }
        out[key] = std::move(value);
      } else {
        const std::size_t start = pos_;
        if (!skip_value()) {
          return Result<JsonFlatMap>::failure("invalid value at offset " + std::to_string(start));
        }
        std::string raw = text_.substr(start, pos_ - start);
        if (raw == "null") {
          out.erase(key);
        } else {
          out[key] = std::move(raw);
        }
      }
      skip_ws();
      if (consume(',')) {
        continue;
      }
      if (consume('}')) {
        break;
      }
      return Result<JsonFlatMap>::failure("expected ',' or '}' at offset " +
                                          std::to_string(pos_));
    }
    return finish(std::move(out));
  }

private:
  Result<JsonFlatMap> finish(JsonFlatMap out) {
    skip_ws();
    if (pos_ != text_.size()) {
      return Result<JsonFlatMap>::failure("trailing characters after object");
    }
    return Result<JsonFlatMap>::success(std::move(out));
  }

  [[nodiscard]] char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  bool consume(const char ch) {
    if (peek() == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  static void append_utf8(std::string &out, std::uint32_t cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parse_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      return false;
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_++];
      out <<= 4;
      if (ch >= '0' && ch <= '9') {
        out |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        out |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        out |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  bool parse_string(std::string &out) {
    if (!consume('"')) {
      return false;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        return false;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) {
          return false;
        }
        if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // A high surrogate must be followed by an escaped low surrogate.
          if (pos_ + 1 >= text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
            return false;
          }
          pos_ += 2;
          std::uint32_t low = 0;
          if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
            return false;
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return false;
      }
    }
    return false;
  }

  bool skip_member_name() {
    skip_ws();
    std::string ignored;
    if (!parse_string(ignored)) {
      return false;
    }
    skip_ws();
    return consume(':');
  }

  bool skip_scalar() {
    if (peek() == '"') {
      std::string ignored;
      return parse_string(ignored);
    }
    const std::size_t start = pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c)) != 0) {
        break;
      }
      ++pos_;
    }
    const std::string literal = text_.substr(start, pos_ - start);
    if (literal == "true" || literal == "false" || literal == "null") {
      return true;
    }
    if (literal.empty()) {
      return false;
    }
    for (const char c : literal) {
      if (std::isdigit(static_cast<unsigned char>(c)) == 0 && c != '-' && c != '+' && c != '.' &&
          c != 'e' && c != 'E') {
        return false;
      }
    }
    return true;
  }

  // Iterative so hostile nesting cannot exhaust the stack.
  bool skip_value() {
    std::vector<char> closers;
    while (true) {
      skip_ws();
      const char ch = peek();
      if (ch == '{' || ch == '[') {
        if (closers.size() >= kMaxNestingDepth) {
          return false;
        }
        ++pos_;
        closers.push_back(ch == '{' ? '}' : ']');
        skip_ws();
        if (!consume(closers.back())) {
          if (closers.back() == '}' && !skip_member_name()) {
            return false;
          }
          continue;
        }
        closers.pop_back();
      } else if (!skip_scalar()) {
        return false;
      }

      while (true) {
        if (closers.empty()) {
          return true;
        }
        skip_ws();
        if (consume(',')) {
          if (closers.back() == '}' && !skip_member_name()) {
            return false;
          }
          break;
        }
        if (!consume(closers.back())) {
          return false;
        }
        closers.pop_back();
      }
    }
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        std::ostringstream code;
        code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
             << static_cast<int>(static_cast<unsigned char>(ch));
        escaped += code.str();
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_string(const std::string &value) { return "\"" + json_escape(value) + "\""; }

Result<JsonFlatMap> json_parse_flat(const std::string &json) { return FlatParser(json).parse(); }

std::string json_field(const JsonFlatMap &map, const std::string &key,
                       const std::string &fallback) {
  const auto it = map.find(key);
  return it == map.end() ? fallback : it->second;
}

} // namespace remotegate::common
