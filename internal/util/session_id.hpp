#pragma once

#include <string>

namespace rollout::util {

// Random version 4 UUID in canonical lower-case text form. Safe to use
// as a file name.
std::string NewSessionId();

} // namespace rollout::util
