#pragma once

#include "internal/model/media_record.hpp"

namespace pef::copy {

/*
  One leftover media file waiting to be copied into the unmatched area.
*/
struct CopyTask {
  model::MediaRecord record;
};

} // namespace pef::copy
