#include "cursorhist/common/text.hpp"

namespace cursorhist::common {

namespace {

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

bool is_continuation(unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

} // namespace

std::size_t decode_utf8(const std::string &input, const std::size_t pos, char32_t &code_point) {
  if (pos >= input.size()) {
    return 0;
  }
  const auto lead = static_cast<unsigned char>(input[pos]);
  if (lead < 0x80U) {
    code_point = lead;
    return 1;
  }

  std::size_t length = 0;
  char32_t min_value = 0;
  char32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    length = 2;
    min_value = 0x80;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    length = 3;
    min_value = 0x800;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    length = 4;
    min_value = 0x10000;
    value = lead & 0x07U;
  } else {
    return 0;
  }

  if (pos + length > input.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(input[pos + i]);
    if (!is_continuation(byte)) {
      return 0;
    }
    value = (value << 6U) | (byte & 0x3FU);
  }

  if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    return 0;
  }
  code_point = value;
  return length;
}

bool is_unicode_space(const char32_t code_point) {
  switch (code_point) {
  case 0x20:
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return (code_point >= 0x09 && code_point <= 0x0D) ||
           (code_point >= 0x1C && code_point <= 0x1F) ||
           (code_point >= 0x2000 && code_point <= 0x200A);
  }
}

std::string trim_unicode(const std::string &input) {
  std::size_t first = std::string::npos;
  std::size_t last = 0;
  std::size_t pos = 0;
  while (pos < input.size()) {
    char32_t code_point = 0;
    std::size_t length = decode_utf8(input, pos, code_point);
    if (length == 0) {
      // Malformed bytes count as text.
      length = 1;
      code_point = REPLACEMENT_CHARACTER;
    }
    if (!is_unicode_space(code_point)) {
      if (first == std::string::npos) {
        first = pos;
      }
      last = pos + length;
    }
    pos += length;
  }
  if (first == std::string::npos) {
    return "";
  }
  return input.substr(first, last - first);
}

std::string sanitize_utf8(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  std::size_t pos = 0;
  while (pos < input.size()) {
    char32_t code_point = 0;
    const std::size_t length = decode_utf8(input, pos, code_point);
    if (length == 0) {
      append_utf8(out, REPLACEMENT_CHARACTER);
      ++pos;
      continue;
    }
    out.append(input, pos, length);
    pos += length;
  }
  return out;
}

void append_utf8(std::string &out, const char32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else {
    append_utf8(out, REPLACEMENT_CHARACTER);
  }
}

std::size_t utf8_length(const std::string &text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!is_continuation(static_cast<unsigned char>(ch))) {
      ++count;
    }
  }
  return count;
}

std::string utf8_truncate(const std::string &text, const std::size_t max_code_points) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation(static_cast<unsigned char>(text[i]))) {
      continue;
    }
    if (seen == max_code_points) {
      return text.substr(0, i);
    }
    ++seen;
  }
  return text;
}

std::string strip_tags(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '<') {
      const auto close = text.find('>', pos + 1);
      if (close != std::string::npos && close > pos + 1) {
        pos = close + 1;
        continue;
      }
    }
    out.push_back(text[pos]);
    ++pos;
  }
  return out;
}

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t code_point = 0;
    std::size_t length = decode_utf8(text, pos, code_point);
    if (length == 0) {
      length = 1;
      code_point = REPLACEMENT_CHARACTER;
    }
    if (is_unicode_space(code_point)) {
      pending_space = !out.empty();
      pos += length;
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.append(text, pos, length);
    pos += length;
  }
  return out;
}

std::string clean_text(const std::string &text) { return collapse_whitespace(strip_tags(text)); }

} // namespace cursorhist::common
