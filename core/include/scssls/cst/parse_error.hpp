// scssls/cst/parse_error.hpp - Closed taxonomy of syntax errors
#pragma once

#include <cstdint>
#include <string_view>

namespace scssls::cst
{

enum class ParseError : uint8_t {
#define SCSSLS_PARSE_ERROR(Kind, Code, Message) Kind,
#include "scssls/cst/parse_errors.def"
};

/// Human-readable message, e.g. "colon expected"
[[nodiscard]] std::string_view message(ParseError error) noexcept;

/// Stable diagnostic code, e.g. "E005"
[[nodiscard]] std::string_view code(ParseError error) noexcept;

}  // namespace scssls::cst
