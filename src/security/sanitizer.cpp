#include "playwarden/security/sanitizer.hpp"

#include "playwarden/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace playwarden::security {

namespace {

bool is_plain_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' ||
         ch == '.';
}

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_blank(const char ch) { return ch == ' ' || ch == '\t'; }

bool ends_inline_value(const char ch) {
  return is_space(ch) || ch == ',' || ch == '"' || ch == '\'' || ch == '}' || ch == ']';
}

std::size_t leading_whitespace(const std::string &line) {
  std::size_t pos = 0;
  while (pos < line.size() && is_blank(line[pos])) {
    ++pos;
  }
  return pos;
}

/// Position of the unescaped `"` closing a string whose body starts at `pos`.
std::size_t find_closing_quote(const std::string &line, std::size_t pos) {
  while (pos < line.size()) {
    if (line[pos] == '\\') {
      pos += 2;
      continue;
    }
    if (line[pos] == '"') {
      return pos;
    }
    ++pos;
  }
  return std::string::npos;
}

struct LeadingPair {
  std::size_t key_begin = 0;
  std::size_t key_end = 0;
  std::size_t value_begin = 0;
  bool colon = false;
};

/// `key: value`, `key = value` or `"key": value` at the start of a line,
/// optionally behind a YAML list dash.
std::optional<LeadingPair> split_leading_pair(const std::string &line) {
  std::size_t pos = 0;
  while (pos < line.size() && is_space(line[pos])) {
    ++pos;
  }
  if (pos + 1 < line.size() && line[pos] == '-' && is_space(line[pos + 1])) {
    ++pos;
    while (pos < line.size() && is_space(line[pos])) {
      ++pos;
    }
  }
  if (pos < line.size() && line[pos] == '"') {
    ++pos;
  }

  LeadingPair pair;
  pair.key_begin = pos;
  while (pos < line.size() && is_plain_char(line[pos])) {
    ++pos;
  }
  pair.key_end = pos;
  if (pair.key_end == pair.key_begin) {
    return std::nullopt;
  }

  std::size_t cursor = pos;
  if (cursor < line.size() && line[cursor] == '"') {
    ++cursor;
  }
  if (cursor < line.size() && line[cursor] == ':') {
    pair.colon = true;
    ++cursor;
  } else {
    cursor = pos;
    while (cursor < line.size() && is_blank(line[cursor])) {
      ++cursor;
    }
    if (cursor >= line.size() || line[cursor] != '=') {
      return std::nullopt;
    }
    ++cursor;
  }
  while (cursor < line.size() && is_blank(line[cursor])) {
    ++cursor;
  }
  pair.value_begin = cursor;
  return pair;
}

/// `|`, `>`, `|-`, `>+2` and friends.
bool is_block_indicator(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty() || (trimmed.front() != '|' && trimmed.front() != '>')) {
    return false;
  }
  return std::all_of(trimmed.begin() + 1, trimmed.end(), [](const char ch) {
    return ch == '-' || ch == '+' || (ch >= '1' && ch <= '9');
  });
}

std::string masked_value(const std::string &value) {
  std::string body = value;
  std::string trailer;
  if (!body.empty() && body.back() == ',') {
    trailer = ",";
    body.pop_back();
  }
  body = common::trim(body);
  if (!body.empty() && (body.front() == '"' || body.front() == '\'')) {
    const char quote = body.front();
    return std::string(1, quote) + MASK_MARKER + std::string(1, quote) + trailer;
  }
  return std::string(MASK_MARKER) + trailer;
}

} // namespace

std::string_view argument_class_name(const ArgumentClass cls) {
  switch (cls) {
  case ArgumentClass::Identifier:
    return "identifier";
  case ArgumentClass::PathFragment:
    return "path";
  case ArgumentClass::ProcessArgument:
    return "argument";
  case ArgumentClass::ContentBody:
    return "content";
  }
  return "argument";
}

bool is_allowed(const std::string &value, const ArgumentClass cls) {
  switch (cls) {
  case ArgumentClass::Identifier:
    if (!value.empty() && value.front() == '.') {
      return false;
    }
    return std::all_of(value.begin(), value.end(), is_plain_char);
  case ArgumentClass::PathFragment:
    return std::all_of(value.begin(), value.end(),
                       [](const char ch) { return is_plain_char(ch) || ch == '/' || ch == ':'; });
  case ArgumentClass::ProcessArgument:
    // A leading dash would be read as an engine option.
    if (!value.empty() && value.front() == '-') {
      return false;
    }
    return std::all_of(value.begin(), value.end(), [](const char ch) {
      return is_plain_char(ch) || ch == '/' || ch == ':' || ch == ',' || ch == '=' ||
             ch == '@' || ch == '*' || ch == ' ' || ch == '&' || ch == '!';
    });
  case ArgumentClass::ContentBody:
    return std::none_of(value.begin(), value.end(), [](const char ch) {
      const auto byte = static_cast<unsigned char>(ch);
      return (byte < 0x20U && ch != '\t' && ch != '\n' && ch != '\r') || byte == 0x7FU;
    });
  }
  return false;
}

InputSanitizer::InputSanitizer(config::MaskingConfig masking) {
  for (auto &keyword : masking.keywords) {
    const std::string normalized = common::to_lower(common::trim(keyword));
    if (!normalized.empty()) {
      keywords_.push_back(normalized);
    }
  }
  for (auto &key : masking.exempt_keys) {
    exempt_keys_.push_back(common::to_lower(common::trim(key)));
  }
}

common::Status InputSanitizer::check(const std::string &value, const ArgumentClass cls,
                                     const std::string_view field) const {
  if (is_allowed(value, cls)) {
    return common::Status::success();
  }
  return common::Status::error(common::ErrorKind::SanitizationRejected,
                               "Invalid characters in '" + std::string(field) + "'");
}

bool InputSanitizer::is_secret_key(const std::string &key) const {
  const std::string normalized = common::to_lower(key);
  const bool exempt =
      std::any_of(exempt_keys_.begin(), exempt_keys_.end(), [&](const std::string &key_name) {
        return !key_name.empty() &&
               (normalized == key_name || common::ends_with(normalized, "_" + key_name));
      });
  if (exempt) {
    return false;
  }
  return std::any_of(keywords_.begin(), keywords_.end(), [&](const std::string &keyword) {
    return normalized.find(keyword) != std::string::npos;
  });
}

std::string InputSanitizer::mask_line(const std::string &line) const {
  std::string current = line;

  if (const auto pair = split_leading_pair(current); pair.has_value()) {
    const std::string key = current.substr(pair->key_begin, pair->key_end - pair->key_begin);
    const std::string value = current.substr(pair->value_begin);
    if (is_secret_key(key) && !common::trim(value).empty() &&
        !(pair->colon && is_block_indicator(value))) {
      current = current.substr(0, pair->value_begin) + masked_value(value);
    }
  }

  return mask_inline_tokens(mask_quoted_pairs(current));
}

std::string InputSanitizer::mask_quoted_pairs(const std::string &line) const {
  std::string out;
  out.reserve(line.size());
  std::size_t copied = 0;
  std::size_t pos = 0;
  while (pos < line.size()) {
    if (line[pos] != '"') {
      ++pos;
      continue;
    }
    std::size_t cursor = pos + 1;
    const std::size_t key_begin = cursor;
    while (cursor < line.size() && is_plain_char(line[cursor])) {
      ++cursor;
    }
    const std::size_t key_end = cursor;
    if (key_end == key_begin || cursor >= line.size() || line[cursor] != '"') {
      ++pos;
      continue;
    }
    ++cursor;
    while (cursor < line.size() && is_space(line[cursor])) {
      ++cursor;
    }
    if (cursor >= line.size() || line[cursor] != ':') {
      ++pos;
      continue;
    }
    ++cursor;
    while (cursor < line.size() && is_space(line[cursor])) {
      ++cursor;
    }
    if (cursor >= line.size() || line[cursor] != '"') {
      ++pos;
      continue;
    }
    const std::size_t value_begin = cursor + 1;
    const std::size_t value_end = find_closing_quote(line, value_begin);
    if (value_end == std::string::npos) {
      ++pos;
      continue;
    }
    if (is_secret_key(line.substr(key_begin, key_end - key_begin))) {
      out.append(line, copied, value_begin - copied);
      out += MASK_MARKER;
      copied = value_end;
    }
    pos = value_end + 1;
  }
  out.append(line, copied, std::string::npos);
  return out;
}

std::string InputSanitizer::mask_inline_tokens(const std::string &line) const {
  std::string out;
  out.reserve(line.size());
  std::size_t copied = 0;
  std::size_t pos = 0;
  while (pos < line.size()) {
    if (!is_plain_char(line[pos])) {
      ++pos;
      continue;
    }
    const std::size_t key_begin = pos;
    while (pos < line.size() && is_plain_char(line[pos])) {
      ++pos;
    }
    const std::size_t key_end = pos;
    if (pos >= line.size() || line[pos] != '=') {
      continue;
    }

    const std::size_t value_begin = pos + 1;
    std::size_t value_end = value_begin;
    if (value_begin < line.size() && line[value_begin] == '"') {
      const std::size_t close = find_closing_quote(line, value_begin + 1);
      if (close == std::string::npos) {
        continue;
      }
      value_end = close + 1;
    } else {
      while (value_end < line.size() && !ends_inline_value(line[value_end])) {
        ++value_end;
      }
      if (value_end == value_begin) {
        continue;
      }
    }

    if (is_secret_key(line.substr(key_begin, key_end - key_begin))) {
      out.append(line, copied, value_begin - copied);
      out += masked_value(line.substr(value_begin, value_end - value_begin));
      copied = value_end;
    }
    pos = value_end;
  }
  out.append(line, copied, std::string::npos);
  return out;
}

bool InputSanitizer::opens_secret_block(const std::string &line) const {
  const auto pair = split_leading_pair(line);
  if (!pair.has_value() || !pair->colon) {
    return false;
  }
  const std::string value = line.substr(pair->value_begin);
  return is_secret_key(line.substr(pair->key_begin, pair->key_end - pair->key_begin)) &&
         (common::trim(value).empty() || is_block_indicator(value));
}

std::string InputSanitizer::mask(const std::string &text) const {
  if (keywords_.empty() || text.empty()) {
    return text;
  }
  std::string out;
  out.reserve(text.size());
  // Indentation of the secret key whose nested or block value is being hidden.
  std::optional<std::size_t> block_indent;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t end = text.find('\n', start);
    const bool last = end == std::string::npos;
    std::string line = last ? text.substr(start) : text.substr(start, end - start);
    bool carriage = false;
    if (!last && !line.empty() && line.back() == '\r') {
      line.pop_back();
      carriage = true;
    }

    const std::size_t indent = leading_whitespace(line);
    if (block_indent.has_value() && indent == line.size()) {
      out += line;
    } else if (block_indent.has_value() && indent > *block_indent) {
      out.append(line, 0, indent);
      out += MASK_MARKER;
    } else {
      block_indent.reset();
      out += mask_line(line);
      if (opens_secret_block(line)) {
        block_indent = indent;
      }
    }

    if (last) {
      break;
    }
    if (carriage) {
      out.push_back('\r');
    }
    out.push_back('\n');
    start = end + 1;
  }
  return out;
}

} // namespace playwarden::security
