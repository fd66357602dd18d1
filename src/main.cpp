#include <boost/program_options.hpp>
#include <snapkeep/execution/engine.hpp>
#include <snapkeep/execution/report.hpp>
#include <snapkeep/storage/zfs/storage.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifndef SNAPKEEP_VERSION
#define SNAPKEEP_VERSION "0.0.0"
#endif

namespace {

namespace po = boost::program_options;
using engine_t = snapkeep::execution::engine<snapkeep::storage::zfs_storage_tag>;

void print_version() {
  std::cout << "snapkeep v" << SNAPKEEP_VERSION << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  snapkeep <status | snap | gc | help | version> [options]\n"
            << "  snapkeep protect <dataset@snapshot> [options]\n"
            << "  snapkeep policy <dataset> <policy> [options]\n\n";
  std::cout << options << '\n';
  std::cout << "Tips:\n"
            << "  use 'zfs set " << snapkeep::schema::kSnapkeepProperty
            << "=h24d30w8m6y1 some/dataset' to enable.\n"
            << "  use 'zfs set " << snapkeep::schema::kSnapkeepProperty
            << "=- some/dataset@some-snap' to retain.\n"
            << "  add 'snapkeep snap' to cron.hourly.\n"
            << "  add 'snapkeep gc'   to cron.daily.\n";
  print_version();
}

void setup_logging(const bool verbose, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "snapkeep", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

int finish(const snapkeep::schema::run_report_t& report,
           const std::string& output) {
  std::cout << output << snapkeep::execution::render_failures(report);
  std::cout.flush();
  spdlog::shutdown();
  return snapkeep::execution::exit_code(report);
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_file = std::string{};
  auto zfs_binary = std::string{};
  auto args = std::vector<std::string>{};

  auto options = po::options_description{"snapkeep options"};
  options.add_options()("help,h", "show help")("version", "show version")(
      "verbose,v", "enable debug logging")(
      "log-file", po::value<std::string>(&log_file),
      "also append log output to this file")(
      "zfs-binary", po::value<std::string>(&zfs_binary)->default_value("zfs"),
      "zfs command to run");
  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command),
                       "status|snap|gc|protect|policy|help|version")(
      "args", po::value<std::vector<std::string>>(&args), "command arguments");
  auto all = po::options_description{};
  all.add(options).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("args", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "snapkeep: " << e.what() << "\n\n";
    print_help(options);
    return snapkeep::execution::kExitUsage;
  }

  if (vm.contains("help") || command.empty() || command == "help") {
    print_help(options);
    return snapkeep::execution::kExitSuccess;
  }
  if (vm.contains("version") || command == "version") {
    print_version();
    return snapkeep::execution::kExitSuccess;
  }

  const auto expected_args = command == "protect"  ? std::size_t{1}
                             : command == "policy" ? std::size_t{2}
                                                   : std::size_t{0};
  const auto known = command == "status" || command == "snap" ||
                     command == "gc" || command == "protect" ||
                     command == "policy";
  if (!known || args.size() != expected_args) {
    std::cerr << "snapkeep: invalid command line\n\n";
    print_help(options);
    return snapkeep::execution::kExitUsage;
  }

  try {
    setup_logging(vm.contains("verbose"), log_file);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "snapkeep: " << e.what() << '\n';
    return snapkeep::execution::kExitUsage;
  }

  auto storage =
      snapkeep::storage::make_storage<snapkeep::storage::zfs_storage_tag>(
          zfs_binary);
  auto engine = engine_t{storage};
  const auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());

  if (command == "status") {
    auto report = engine.status(now);
    return finish(report, snapkeep::execution::render_status(report));
  }
  if (command == "snap") {
    auto report = engine.snap(now);
    return finish(report, snapkeep::execution::render_changes(report));
  }
  if (command == "gc") {
    auto report = engine.gc(now);
    return finish(report, snapkeep::execution::render_changes(report));
  }
  if (command == "protect") {
    auto report = engine.protect(args[0]);
    return finish(report, {});
  }
  auto report = engine.set_policy(args[0], args[1]);
  return finish(report, {});
}
