#pragma once

#include <functional>
#include <string>

namespace helpdesk_core {

// fraction in [0, 1] and a short human readable message
using ProgressUpdater = std::function<void(float, const std::string &)>;

}  // namespace helpdesk_core
