#pragma once

#include <string>

namespace metric {

std::string read_text_file_or_throw(const std::string& path);

// True when path names a Metric source file (".metric" extension).
bool has_source_extension(const std::string& path);

} // namespace metric
