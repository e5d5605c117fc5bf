#pragma once

#include <string>
#include <string_view>

namespace sb {

// Escapes `s` for use inside a JSON string literal.
std::string json_escape(std::string_view s);

// json_escape wrapped in double quotes.
std::string json_quote(std::string_view s);

} // namespace sb
