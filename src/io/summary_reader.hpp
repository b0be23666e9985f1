#pragma once

#include <istream>
#include <string>

#include "core/types.hpp"

namespace panannot {

// Parse a run summary written by write_summary_tab().
// Columns are located through the "# name ..." header line. Engine warning
// texts are not stored in the file, so AnnotationResult::warnings stays empty.
bool read_summary_tab(std::istream& in, RunSummary& summary, std::string& error_msg);

bool read_summary_tab(const std::string& path, RunSummary& summary,
                      std::string& error_msg);

} // namespace panannot
