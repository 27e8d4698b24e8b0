#include "logging.hpp"
#include "sector_host.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <iostream>
#include <thread>

using namespace sectorcast;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:46080";
  std::string log_level = "info";
  HostConfig cfg;
  cfg.threads = std::max(2u, std::thread::hardware_concurrency());

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--threads")
      cfg.threads = std::stoi(next(i));
    else if (a == "--capacity") {
      if (!parse_size(next(i), cfg.capacity)) {
        std::cerr << "bad capacity" << std::endl;
        return 1;
      }
    } else if (a == "--max-sector") {
      uint64_t v = 0;
      if (!parse_size(next(i), v) || v > kMaxPayload) {
        std::cerr << "bad max sector" << std::endl;
        return 1;
      }
      cfg.max_sector = (uint32_t)v;
    } else if (a == "--dir")
      cfg.storage_dir = next(i);
    else if (a == "--log-level")
      log_level = next(i);
    else {
      std::cerr << "unknown option " << a << std::endl;
      return 1;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  std::string err;
  if (!cfg.validate(err)) {
    std::cerr << err << std::endl;
    return 1;
  }

  asio::io_context io;
  SectorHost host(io, cfg);
  try {
    host.start();
  } catch (const std::system_error &e) {
    std::cerr << "listen on " << listen << " failed: " << e.what() << std::endl;
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) {
    Logger::instance().log(LogLevel::INFO,
                           "shutting down, %zu sectors stored (%llu bytes)",
                           host.stored_sectors(),
                           (unsigned long long)host.stored_bytes());
    io.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
