#pragma once

#include <string_view>

namespace idreg {

bool is_valid_utf8(std::string_view text);

// A registrable name: non-empty, valid UTF-8, fits on a single store line.
bool is_valid_name(std::string_view name);

} // namespace idreg
