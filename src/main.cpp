#include "config/options.hpp"
#include "hashing/fingerprint.hpp"
#include "logger/logger.hpp"
#include "server/stub_cas.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Reads every seed file into a blob map keyed by its content fingerprint
stubcas::cas::BlobMap load_seed_files(const std::vector<std::string>& paths) {
  stubcas::cas::BlobMap blobs;
  for (const auto& path : paths) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      throw std::runtime_error("Cannot open seed file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto digest = stubcas::hashing::Digest::of_bytes(content);
    BOOST_LOG_TRIVIAL(info) << "Seed: " << path << " as " << digest;
    blobs[digest.fingerprint] = std::move(content);
  }
  return blobs;
}

bool run_server(const stubcas::config::ProgramOptions& options) {
  try {
    auto blobs = load_seed_files(options.seed_files);
    stubcas::server::StubCas server(options.chunk_size, std::move(blobs), options.port, options.host);

    // Test harnesses read the address from the first line of stdout
    std::cout << server.address() << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "quit") {
        break;
      }
    }

    BOOST_LOG_TRIVIAL(info) << "Main: Shutting down after " << server.read_request_count()
                            << " read requests";
    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start stub CAS: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = stubcas::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    stubcas::logger::init_logging(options.log_options);
  } catch (const std::exception&) {
    return 1;
  }

  if (!run_server(options)) {
    return 1;
  }
  return 0;
}
