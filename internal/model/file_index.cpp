#include "file_index.hpp"

#include "internal/util/unicode.hpp"

namespace pef::model {

void FileIndex::Add(const MediaRecord& record) {
  entries_[Key{util::ToNfc(record.album), util::ToNfc(record.filename)}].push_back(record);
  ++records_;
}

void FileIndex::Clear() {
  entries_.clear();
  records_ = 0;
}

const std::vector<MediaRecord>* FileIndex::Find(const std::string& album, const std::string& filename) const {
  auto it = entries_.find(Key{util::ToNfc(album), util::ToNfc(filename)});
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool FileIndex::Contains(const std::string& album, const std::string& filename) const {
  return Find(album, filename) != nullptr;
}

} // namespace pef::model
