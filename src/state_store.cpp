#include "state_store.hpp"

#include "log.hpp"
#include "platform.hpp"
#include "settings_manager.hpp"

namespace dotsync {

StateStore::StateStore(Locker& locker, Logger& logger)
  : locker_(locker), logger_(logger) {}

FileHandle StateStore::open_and_lock(const std::filesystem::path& path) {
  FileHandle file(path, O_RDWR | O_CREAT, 0666);
  try {
    locker_.lock(file.fd(), true);
  } catch(const std::system_error& e) {
    throw std::system_error(e.code(), "locking state file " + path.string());
  }
  logger_.debug("Locked state file path={}", path.string());
  return file;
}

TrackedSet StateStore::load(FileHandle& file) {
  last_load_cached_ = false;
  try {
    auto meta = FileMeta::from_stat(file.stat());
    if(cached_ && meta.same_mtime(cached_meta_) && meta.size == cached_meta_.size) {
      last_load_cached_ = true;
      return *cached_;
    }
    file.seek(0, SEEK_SET);
    auto state = parse(file.read_all());
    cached_ = state;
    cached_meta_ = meta;
    logger_.debug("Loaded state entries={}", state.size());
    return state;
  } catch(const std::exception&) {
    cached_.reset();
    throw;
  }
}

void StateStore::save(FileHandle& file, const TrackedSet& state) {
  file.rewrite(serialize(state));
  file.sync();
  logger_.debug("Saved state entries={}", state.size());
}

TrackedSet StateStore::parse(const std::string& content) {
  TrackedSet state;
  std::size_t start = 0;
  while(start <= content.size()) {
    auto end = content.find('\n', start);
    if(end == std::string::npos) end = content.size();
    auto line = trim_copy(content.substr(start, end - start));
    if(!line.empty()) state.insert(line);
    start = end + 1;
  }
  return state;
}

std::string StateStore::serialize(const TrackedSet& state) {
  std::string out;
  for(const auto& rel : state) {
    out += rel;
    out += '\n';
  }
  return out;
}

} // namespace dotsync
