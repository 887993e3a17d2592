#include "cursorhist/transcript/format.hpp"

#include "cursorhist/common/fs.hpp"

namespace cursorhist::transcript {

TranscriptFormat format_from_extension(std::string_view extension) {
  if (extension == "jsonl") {
    return TranscriptFormat::Jsonl;
  }
  if (extension == "txt") {
    return TranscriptFormat::Text;
  }
  return TranscriptFormat::Unknown;
}

TranscriptFormat format_from_path(const std::filesystem::path &path) {
  return format_from_extension(common::file_extension(path));
}

std::string format_name(const TranscriptFormat format) {
  switch (format) {
  case TranscriptFormat::Jsonl:
    return "jsonl";
  case TranscriptFormat::Text:
    return "txt";
  case TranscriptFormat::Unknown:
    break;
  }
  return "";
}

} // namespace cursorhist::transcript
