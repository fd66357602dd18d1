#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace snapkeep::storage::zfs {

using rows_t = std::vector<std::vector<std::string>>;

struct command_result_t final {
  int exit_code{-1};
  std::string output;
};

/// Single-quote `value` for /bin/sh.
std::string shell_quote(std::string_view value);

std::string join_command(const std::vector<std::string>& argv);

/// Run argv through the shell and capture stdout. stderr is left attached to
/// the caller's stderr. `exit_code` is -1 when the process could not be
/// started or did not exit normally.
command_result_t run_command(const std::vector<std::string>& argv);

/// Split `-H` (scripted mode) output into tab-separated rows, skipping blank
/// lines.
rows_t split_rows(std::string_view output);

}  // namespace snapkeep::storage::zfs
