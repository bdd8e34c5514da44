#pragma once

#include <string>

namespace archive_engine::common {

// Random (v4) UUID in lowercase canonical form
std::string generateId();

} // namespace archive_engine::common
