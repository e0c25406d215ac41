#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/media_record.hpp"

namespace pef::model {

/*
  (album, filename) -> every MediaRecord carrying that key, in scan order.

  Duplicates are kept: two physical files under the same key both come back
  from Find(). Keys compare in Unicode NFC, so a decomposed file name is
  found under its composed spelling and the other way round. Built once per scan and read-only afterwards, so a built
  index may be shared by several threads.
*/
class FileIndex {
 public:
  using Key = std::pair<std::string, std::string>;

  void Add(const MediaRecord& record);
  void Clear();

  // nullptr when nothing is stored under the key.
  const std::vector<MediaRecord>* Find(const std::string& album, const std::string& filename) const;
  bool                            Contains(const std::string& album, const std::string& filename) const;

  std::size_t KeyCount() const {
    return entries_.size();
  }
  std::size_t RecordCount() const {
    return records_;
  }

 private:
  std::map<Key, std::vector<MediaRecord>> entries_;
  std::size_t                             records_ = 0;
};

} // namespace pef::model
