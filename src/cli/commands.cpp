#include "parley/cli/commands.hpp"

#include "parley/common/fs.hpp"
#include "parley/config/config.hpp"
#include "parley/runtime/app.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace parley::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef PARLEY_VERSION
  std::string version = PARLEY_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "parley " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

void print_help() {
  std::cout << version_string() << "\n\n"
            << "Usage: parley [--config PATH] <command> [options]\n\n"
            << "Commands:\n"
            << "  serve [--host H] [--port N]   Run the device WebSocket server\n"
            << "  check-config                  Validate the configuration file\n"
            << "  config-path                   Print the configuration file location\n"
            << "  version                       Print the version\n";
}

int run_serve(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }

  std::string host;
  std::string port_raw;
  if (take_option(args, "--host", "", host)) {
    context.value().mutable_config().server.host = host;
  }
  if (take_option(args, "--port", "-p", port_raw)) {
    std::uint16_t port = 0;
    const auto *end = port_raw.data() + port_raw.size();
    const auto [ptr, ec] = std::from_chars(port_raw.data(), end, port);
    if (ec != std::errc() || ptr != end) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    context.value().mutable_config().server.port = port;
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  runtime::VoiceServer server(std::move(context.value()));
  const auto started = server.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "parley listening on port " << server.port() << " (Ctrl-C to stop)\n";

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  std::cerr << "[runtime] shutting down\n";
  server.stop();
  return 0;
}

int run_check_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    std::cerr << "error: " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "configuration ok\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "check-config") {
    return run_check_config();
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace parley::cli
