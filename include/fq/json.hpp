#pragma once

#include <string>
#include <string_view>

namespace fq {

// Escape for use inside a JSON string literal (quotes not included).
std::string json_escape(std::string_view s);

} // namespace fq
