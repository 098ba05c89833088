#ifndef STUBCAS_CONFIG_OPTIONS_HPP
#define STUBCAS_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace stubcas {
namespace config {

struct ProgramOptions {
  std::string host{"127.0.0.1"};
  uint16_t port{0};
  int64_t chunk_size{1024};
  // Files whose content is seeded under its SHA-256 fingerprint
  std::vector<std::string> seed_files;
  logger::LogOptions log_options;
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Invalid arguments print usage to err and leave valid false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace stubcas

#endif // STUBCAS_CONFIG_OPTIONS_HPP
