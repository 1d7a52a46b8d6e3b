#pragma once

#include <string>
#include <vector>

namespace glob_expander {

// Expands a pathname pattern against the filesystem. Backslash-escaped characters match
// literally. With globstar, a `**` segment matches any number of directories. Results are
// sorted; when nothing matches the unescaped pattern is returned as the only element.
std::vector<std::string> pathname_expand(const std::string& pattern, bool globstar);

// Same walk as pathname_expand, but an unmatched pattern yields no entries.
std::vector<std::string> match_paths(const std::string& pattern, bool globstar);

}  // namespace glob_expander
