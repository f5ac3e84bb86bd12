#pragma once

#include <cstdint>
#include <string>

namespace lanshare {
namespace store {

// Reduces a client supplied filename to a flat name made of [A-Za-z0-9_.-].
// Accented letters are decomposed to their ASCII base, '/' and whitespace runs
// become '_', everything else outside the set is dropped, and leading/trailing
// '.' and '_' are stripped.
// The result may be empty, in which case the name is unusable.
std::string sanitize_filename(const std::string& raw);

// Human readable size: "0.5 KB" below 1 MiB, "2.0 MB" from 1 MiB on
std::string format_size(std::uintmax_t bytes);

// True for names the listing hides (leading '.')
bool is_hidden(const std::string& name);

} // namespace store
} // namespace lanshare
