#pragma once

#include "liveviewer/platform/v1/watch_stat.pb.h"

namespace liveviewer::platform::wire {
using namespace ::liveviewer::platform::v1;
}
