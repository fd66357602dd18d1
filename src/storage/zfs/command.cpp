#include <snapkeep/storage/zfs/command.hpp>
#include <spdlog/spdlog.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <array>
#include <cstdio>
#include <utility>

#include <sys/wait.h>

namespace snapkeep::storage::zfs {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string join_command(const std::vector<std::string>& argv) {
  auto out = std::string{};
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += shell_quote(arg);
  }
  return out;
}

command_result_t run_command(const std::vector<std::string>& argv) {
  auto result = command_result_t{};
  const auto command = join_command(argv);
  spdlog::debug("exec: {}", command);

  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    spdlog::error("failed to start '{}'", command);
    return result;
  }
  auto buffer = std::array<char, 4096>{};
  auto read = size_t{0};
  while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), read);
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return result;
  }
  result.exit_code = WEXITSTATUS(status);
  return result;
}

rows_t split_rows(const std::string_view output) {
  auto lines = std::vector<std::string>{};
  const auto text = std::string{output};
  boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));

  auto rows = rows_t{};
  for (auto& line : lines) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    auto columns = std::vector<std::string>{};
    boost::algorithm::split(columns, line, boost::algorithm::is_any_of("\t"));
    rows.push_back(std::move(columns));
  }
  return rows;
}

}  // namespace snapkeep::storage::zfs
