#pragma once
#include "lexer.h"

namespace metric {

// Whitespace and layout rules checked after tokenizing and before parsing.
// Throws StyleError on the first violation.
void validate_style(const std::string& source, const std::vector<Token>& tokens);

}
