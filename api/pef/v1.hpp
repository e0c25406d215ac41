#pragma once

#include "config/config.pb.h"
#include "pef/state/v1/state.pb.h"
#include "pef/takeout/v1/sidecar.pb.h"

namespace pef::v1 {
using namespace ::pef::state::v1;
using namespace ::pef::takeout::v1;
}
