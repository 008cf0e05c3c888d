#pragma once

#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dotsync {

struct SyncEnvironment;

// Raised when the BEGIN/END tags of the section being written are malformed.
// The target file is left untouched.
class SectionFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Part of a parsed file: raw text or one named section including its tags.
struct Chunk {
  bool is_section = false;
  std::string name;
  std::vector<std::string> lines;
};

// Line indices of a valid BEGIN/END pair, both inclusive.
struct Span {
  std::size_t start = 0;
  std::size_t end = 0;
  std::string name;
};

struct MergeResult {
  std::string content;
  bool changed = false;
};

// Section source naming: "<target>.<name>-section".
struct SectionPath {
  std::string target;
  std::string name;
};

std::optional<SectionPath> match_section_path(const std::string& rel_path);

std::optional<std::string> match_begin(const std::string& line);
std::optional<std::string> match_end(const std::string& line);

// Splits on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& content);

std::vector<Span> find_valid_sections(const std::vector<std::string>& lines, const std::string& target);
std::vector<Chunk> parse_chunks(const std::vector<std::string>& lines, const std::string& target);
std::vector<std::string> wrap_section(const std::vector<std::string>& body, const std::string& name);
// Replaces the chunk named like `section`, or inserts it before the first
// section that sorts after it, or appends.
std::vector<Chunk> merge_chunks(const std::vector<Chunk>& chunks, const Chunk& section);
std::string serialize_chunks(const std::vector<Chunk>& chunks);

MergeResult merge_section_content(const std::string& existing,
                                  const std::vector<std::string>& body,
                                  const std::string& name);
// `changed` is false when the section was not present.
MergeResult remove_section_content(const std::string& existing, const std::string& name);

// Applies section sources to target files under an exclusive lock.
class SectionMerger {
public:
  explicit SectionMerger(SyncEnvironment& env);

  bool merge(const std::filesystem::path& source,
             const std::filesystem::path& target,
             const std::string& name,
             mode_t source_mode);

  // A missing target file is not an error.
  bool remove(const std::filesystem::path& target, const std::string& name);

private:
  SyncEnvironment& env_;
};

} // namespace dotsync
