#pragma once

namespace dropfile {

/// Enable or disable debug-level output (off by default).
void set_verbose(bool verbose);
bool is_verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Printed to stderr only when verbose output is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace dropfile
