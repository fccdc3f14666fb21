#include "playwarden/common/keyvalue.hpp"

#include "playwarden/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace playwarden::common {

namespace {

bool is_comment_char(const char ch, const KeyValueDialect dialect) {
  return ch == '#' || (dialect == KeyValueDialect::Ini && ch == ';');
}

std::string strip_comment(const std::string &line, const KeyValueDialect dialect) {
  if (dialect == KeyValueDialect::Ini) {
    // INI only treats comments as whole-line.
    const std::string trimmed = trim(line);
    if (!trimmed.empty() && is_comment_char(trimmed.front(), dialect)) {
      return "";
    }
    return line;
  }

  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

std::size_t find_separator(const std::string &line, const KeyValueDialect dialect) {
  if (dialect == KeyValueDialect::Toml) {
    return line.find('=');
  }
  const std::size_t equals = line.find('=');
  const std::size_t colon = line.find(':');
  if (equals == std::string::npos) {
    return colon;
  }
  if (colon == std::string::npos) {
    return equals;
  }
  return std::min(equals, colon);
}

} // namespace

bool KeyValueDocument::has(const std::string &key) const { return values.contains(key); }

bool KeyValueDocument::has_section(const std::string &section) const {
  return std::find(sections.begin(), sections.end(), section) != sections.end();
}

std::string KeyValueDocument::get_string(const std::string &key,
                                         const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool KeyValueDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true" || normalized == "yes") {
    return true;
  }
  if (normalized == "false" || normalized == "no") {
    return false;
  }
  return fallback;
}

std::uint64_t KeyValueDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
KeyValueDocument::get_string_array(const std::string &key,
                                   const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<KeyValueDocument> parse_key_values(const std::string &content,
                                          const KeyValueDialect dialect) {
  KeyValueDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::string last_key;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string uncommented = strip_comment(line, dialect);
    const std::string clean_line = trim(uncommented);
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<KeyValueDocument>::failure(
            ErrorKind::ParseError, "Invalid empty section at line " + std::to_string(line_number));
      }
      if (!document.has_section(current_section)) {
        document.sections.push_back(current_section);
      }
      last_key.clear();
      continue;
    }

    const bool indented = !uncommented.empty() && (uncommented.front() == ' ' ||
                                                   uncommented.front() == '\t');
    if (dialect == KeyValueDialect::Ini && indented && !last_key.empty()) {
      document.values[last_key] += "\n" + clean_line;
      continue;
    }

    const std::size_t separator = find_separator(clean_line, dialect);
    if (separator == std::string::npos) {
      return Result<KeyValueDocument>::failure(
          ErrorKind::ParseError, "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, separator));
    const std::string value = trim(clean_line.substr(separator + 1));
    if (key.empty()) {
      return Result<KeyValueDocument>::failure(
          ErrorKind::ParseError, "Missing key at line " + std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
    last_key = full_key;
  }

  return Result<KeyValueDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace playwarden::common
