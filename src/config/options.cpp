#include "config/options.hpp"
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace stubcas {
namespace config {

namespace {

enum class Flag { HOST, PORT, CHUNK_SIZE, SEED, LOG_LEVEL, LOG_FILE };

const std::unordered_map<std::string, Flag>& flag_map() {
  static const std::unordered_map<std::string, Flag> flags = {
    {"-h", Flag::HOST},
    {"--host", Flag::HOST},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"-c", Flag::CHUNK_SIZE},
    {"--chunk-size", Flag::CHUNK_SIZE},
    {"-s", Flag::SEED},
    {"--seed", Flag::SEED},
    {"-l", Flag::LOG_LEVEL},
    {"--log-level", Flag::LOG_LEVEL},
    {"-f", Flag::LOG_FILE},
    {"--log-file", Flag::LOG_FILE}
  };
  return flags;
}

// std::stoll accepts trailing garbage, the whole value must be consumed
int64_t parse_integer(const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("trailing characters in " + value);
  }
  return parsed;
}

} // namespace

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -h, --host        Listen address (default 127.0.0.1)\n"
      << "  -p, --port        Listen port, 0 for ephemeral (default 0)\n"
      << "  -c, --chunk-size  Bytes per read chunk, negative to fail every request (default 1024)\n"
      << "  -s, --seed        File to seed into the store, repeatable\n"
      << "  -l, --log-level   trace|debug|info|warning|error|fatal (default info)\n"
      << "  -f, --log-file    Also log to this file\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 3001 -c 64 -s data.bin\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "stub_cas_server";

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    auto it = flag_map().find(flag);
    if (it == flag_map().end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[i + 1]);

    try {
      switch (it->second) {
        case Flag::HOST:
          options.host = value;
          break;
        case Flag::PORT: {
          int64_t port = parse_integer(value);
          if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw std::out_of_range("port " + value);
          }
          options.port = static_cast<uint16_t>(port);
          break;
        }
        case Flag::CHUNK_SIZE:
          options.chunk_size = parse_integer(value);
          if (options.chunk_size == 0) {
            throw std::invalid_argument("chunk size must not be zero");
          }
          break;
        case Flag::SEED:
          options.seed_files.push_back(value);
          break;
        case Flag::LOG_LEVEL:
          options.log_options.min_level = logger::parse_severity(value);
          break;
        case Flag::LOG_FILE:
          options.log_options.log_file = value;
          break;
      }
    } catch (const std::exception& e) {
      err << "Error: Invalid value for " << flag << ": " << e.what() << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (options.host.empty()) {
    err << "Error: Host must not be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace stubcas
