#include "io_utils.h"
#include "common.h"
#include "constants.h"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace metric {

std::string read_text_file_or_throw(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CompileError("Cannot open file: " + path, SourceLocation());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool has_source_extension(const std::string& path) {
    return std::filesystem::path(path).extension() == SOURCE_FILE_EXTENSION;
}

} // namespace metric
