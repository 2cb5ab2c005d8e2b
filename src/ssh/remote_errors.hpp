#pragma once

#include <string>
#include <core/types.hpp>

// Classify an error message printed by a remote command (scp, mkdir, mv, ...).
// Sets `permanent` for conditions a retry cannot fix (disk full, quota).
//
//   "No space left on device"      -> IOError, permanent
//   "Disk quota exceeded"          -> IOError, permanent
//   "Permission denied"            -> InvalidDestination
//   "No such file or directory"    -> InvalidDestination
//   "Not a directory" / "Is a directory" / "Read-only file system" -> InvalidDestination
//   anything else                  -> IOError
ErrorKind classify_remote_error(const std::string& message, bool& permanent);

// First 64-hex-char token of `output`, lowercased; empty if none.
std::string parse_sha256_from_output(const std::string& output);

// Parse a decimal integer (optionally negative) from noisy command output.
// Returns false if no number is present.
bool parse_int_from_output(const std::string& output, int64_t& value);
