#pragma once

#include <cstddef>

namespace metric {

// Source files
constexpr const char* SOURCE_FILE_EXTENSION = ".metric";

// Spaces per indentation level
constexpr size_t INDENT_WIDTH = 4;

}
