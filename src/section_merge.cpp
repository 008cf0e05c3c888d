#include "section_merge.hpp"

#include <fmt/format.h>

#include "file_handle.hpp"
#include "log.hpp"
#include "sync_context.hpp"

namespace dotsync {

namespace {

constexpr const char* kSectionSuffix = "-section";
constexpr const char* kBeginPrefix = "# BEGIN ";
constexpr const char* kEndPrefix = "# END ";

std::optional<std::string> match_tag(const std::string& line, const std::string& prefix) {
  if(line.size() <= prefix.size() || line.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  return line.substr(prefix.size());
}

std::optional<std::size_t> find_end_tag(const std::vector<std::string>& lines,
                                        std::size_t from,
                                        const std::string& name) {
  for(std::size_t j = from; j < lines.size(); ++j) {
    auto end = match_end(lines[j]);
    if(end && *end == name) return j;
    // A second BEGIN of the same name before any END leaves the first open.
    auto begin = match_begin(lines[j]);
    if(begin && *begin == name) break;
  }
  return std::nullopt;
}

} // namespace

std::optional<SectionPath> match_section_path(const std::string& rel_path) {
  const std::string suffix = kSectionSuffix;
  if(rel_path.size() <= suffix.size() ||
     rel_path.compare(rel_path.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return std::nullopt;
  }
  std::string stem = rel_path.substr(0, rel_path.size() - suffix.size());
  auto dot = stem.rfind('.');
  if(dot == std::string::npos || dot == 0) return std::nullopt;
  std::string name = stem.substr(dot + 1);
  if(name.empty() || name.find('/') != std::string::npos) return std::nullopt;
  return SectionPath{stem.substr(0, dot), name};
}

std::optional<std::string> match_begin(const std::string& line) {
  return match_tag(line, kBeginPrefix);
}

std::optional<std::string> match_end(const std::string& line) {
  return match_tag(line, kEndPrefix);
}

std::vector<std::string> split_lines(const std::string& content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  for(;;) {
    auto nl = content.find('\n', start);
    if(nl == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  if(!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

std::vector<Span> find_valid_sections(const std::vector<std::string>& lines, const std::string& target) {
  std::vector<Span> spans;
  for(std::size_t i = 0; i < lines.size(); ++i) {
    auto begin = match_begin(lines[i]);
    if(!begin) {
      auto end = match_end(lines[i]);
      if(end && *end == target) {
        throw SectionFormatError(fmt::format(
          "found orphaned closing tag for section '{}' at line {}", target, i + 1));
      }
      continue;
    }

    auto end_index = find_end_tag(lines, i + 1, *begin);
    if(end_index) {
      spans.push_back(Span{i, *end_index, *begin});
      i = *end_index;
    } else if(*begin == target) {
      throw SectionFormatError(fmt::format(
        "found opening tag for section '{}' at line {} but no closing tag", target, i + 1));
    }
    // Unclosed tags of other sections stay raw text.
  }
  return spans;
}

std::vector<Chunk> parse_chunks(const std::vector<std::string>& lines, const std::string& target) {
  std::vector<Chunk> chunks;
  std::size_t cursor = 0;
  for(const auto& span : find_valid_sections(lines, target)) {
    if(span.start > cursor) {
      chunks.push_back(Chunk{false, {}, std::vector<std::string>(lines.begin() + cursor, lines.begin() + span.start)});
    }
    chunks.push_back(Chunk{true, span.name,
                          std::vector<std::string>(lines.begin() + span.start, lines.begin() + span.end + 1)});
    cursor = span.end + 1;
  }
  if(cursor < lines.size()) {
    chunks.push_back(Chunk{false, {}, std::vector<std::string>(lines.begin() + cursor, lines.end())});
  }
  return chunks;
}

std::vector<std::string> wrap_section(const std::vector<std::string>& body, const std::string& name) {
  std::vector<std::string> lines;
  lines.reserve(body.size() + 2);
  lines.push_back(kBeginPrefix + name);
  lines.insert(lines.end(), body.begin(), body.end());
  lines.push_back(kEndPrefix + name);
  return lines;
}

std::vector<Chunk> merge_chunks(const std::vector<Chunk>& chunks, const Chunk& section) {
  std::vector<Chunk> out;
  out.reserve(chunks.size() + 1);
  bool inserted = false;
  for(const auto& chunk : chunks) {
    if(inserted) {
      // Drop any later copy of the same section.
      if(chunk.is_section && chunk.name == section.name) continue;
      out.push_back(chunk);
      continue;
    }
    if(!chunk.is_section) {
      out.push_back(chunk);
    } else if(chunk.name == section.name) {
      out.push_back(section);
      inserted = true;
    } else if(section.name < chunk.name) {
      out.push_back(section);
      out.push_back(chunk);
      inserted = true;
    } else {
      out.push_back(chunk);
    }
  }
  if(!inserted) {
    out.push_back(section);
  }
  return out;
}

std::string serialize_chunks(const std::vector<Chunk>& chunks) {
  std::string out;
  for(const auto& chunk : chunks) {
    for(const auto& line : chunk.lines) {
      out += line;
      out += '\n';
    }
  }
  return out;
}

MergeResult merge_section_content(const std::string& existing,
                                  const std::vector<std::string>& body,
                                  const std::string& name) {
  auto chunks = parse_chunks(split_lines(existing), name);
  Chunk section{true, name, wrap_section(body, name)};
  MergeResult result;
  result.content = serialize_chunks(merge_chunks(chunks, section));
  result.changed = result.content != existing;
  return result;
}

MergeResult remove_section_content(const std::string& existing, const std::string& name) {
  auto chunks = parse_chunks(split_lines(existing), name);
  std::vector<Chunk> kept;
  bool found = false;
  for(auto& chunk : chunks) {
    if(chunk.is_section && chunk.name == name) {
      found = true;
      continue;
    }
    kept.push_back(std::move(chunk));
  }
  if(!found) {
    return MergeResult{existing, false};
  }
  return MergeResult{serialize_chunks(kept), true};
}

SectionMerger::SectionMerger(SyncEnvironment& env) : env_(env) {}

bool SectionMerger::merge(const std::filesystem::path& source,
                          const std::filesystem::path& target,
                          const std::string& name,
                          mode_t source_mode) {
  std::vector<std::string> body;
  {
    FileHandle src(source, O_RDONLY);
    body = split_lines(src.read_all());
  }

  std::error_code ec;
  auto existing = stat_path(target, true, ec);
  if(existing && existing->is_directory()) {
    throw std::runtime_error("conflict: target " + target.string() + " is a directory");
  }

  // Existing files keep their own mode, sanitized by the umask. New files get
  // the regular file policy.
  bool created = false;
  FileHandle dst = FileHandle::try_open(target, O_RDWR, 0, ec);
  if(!dst.is_valid()) {
    if(ec != std::errc::no_such_file_or_directory) {
      throw std::system_error(ec, "open " + target.string());
    }
    dst = FileHandle(target, O_RDWR | O_CREAT, env_.expected_permissions(source_mode));
    created = true;
  }

  env_.locker.lock(dst.fd(), true);

  auto result = merge_section_content(dst.read_all(), body, name);
  if(result.changed) {
    dst.rewrite(result.content);
  }

  const mode_t current = dst.stat().st_mode & 07777;
  const mode_t expected = created
    ? env_.expected_permissions(source_mode)
    : (current & 0777 & ~env_.config.umask);
  if(current != expected) {
    try {
      dst.chmod(expected);
    } catch(const std::system_error& e) {
      env_.logger.warn("Failed to chmod path={} err={}", target.string(), e.what());
    }
  }

  dst.close();
  return result.changed;
}

bool SectionMerger::remove(const std::filesystem::path& target, const std::string& name) {
  std::error_code ec;
  FileHandle dst = FileHandle::try_open(target, O_RDWR, 0, ec);
  if(!dst.is_valid()) {
    if(ec == std::errc::no_such_file_or_directory) return false;
    throw std::system_error(ec, "open " + target.string());
  }

  env_.locker.lock(dst.fd(), true);

  MergeResult result;
  try {
    result = remove_section_content(dst.read_all(), name);
  } catch(const SectionFormatError& e) {
    throw SectionFormatError(std::string("parsing target file: ") + e.what());
  }
  if(!result.changed) return false;

  dst.rewrite(result.content);
  dst.close();
  return true;
}

} // namespace dotsync
