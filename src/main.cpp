#include <exception>
#include <iostream>
#include <stdexcept>

#include "core/config.hpp"
#include "server/coordinator_server.hpp"

static const auto fast_io = []() {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);
  return 0;
}();

int main(int argc, char **argv) {
  try {
    const auto cfg = load_coordinator_config(argc, argv);
    if (cfg.help) {
      std::cout << coordinator_usage();
      return 0;
    }

    CoordinatorServer server(cfg);
    server.start();

    return 0;

  } catch (const std::invalid_argument &e) {
    std::cerr << "error: " << e.what() << "\n" << coordinator_usage();
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
