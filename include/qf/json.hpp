#pragma once

#include <string>
#include <string_view>

namespace qf {

std::string json_escape(std::string_view s);

} // namespace qf
