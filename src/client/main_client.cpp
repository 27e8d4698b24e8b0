#include "client_config.hpp"
#include "file_set.hpp"
#include "logging.hpp"
#include "storage_client.hpp"
#include "tcp_host_session.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>

using namespace sectorcast;

static void usage() {
  std::cerr << "usage: sectorcast_upload --hosts h1:p1,h2:p2 --key <hex> [options] <file>\n"
               "  --path <p>          path in the storage namespace\n"
               "  --memory <size>     upload memory limit (K/M/G suffix)\n"
               "  --min <n>           data sectors per segment\n"
               "  --total <n>         total sectors per segment\n"
               "  --sector-size <s>   sector size (K/M/G suffix)\n"
               "  --threshold <f>     repair download threshold\n"
               "  --key <hex>         32 byte encryption key (required)\n"
               "  --seed <n>          dispatch random seed\n"
               "  --io-threads <n>\n"
               "  --timeout <ms>      per sector host timeout\n"
               "  --retries <n>       stuck repair rounds\n"
               "  --log-level <lvl>\n";
}

int main(int argc, char **argv) {
  ClientConfig cfg;
  std::string hosts, key_hex, local, path, log_level = "info";
  int retries = 0;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--hosts")
        hosts = next(i);
      else if (a == "--path")
        path = next(i);
      else if (a == "--memory") {
        if (!parse_size(next(i), cfg.memory_limit)) {
          std::cerr << "bad memory size" << std::endl;
          return 1;
        }
      } else if (a == "--min")
        cfg.min_sectors = (uint16_t)std::stoi(next(i));
      else if (a == "--total")
        cfg.total_sectors = (uint16_t)std::stoi(next(i));
      else if (a == "--sector-size") {
        uint64_t v = 0;
        if (!parse_size(next(i), v) || v + SodiumAead::overhead() > kMaxPayload) {
          std::cerr << "bad sector size" << std::endl;
          return 1;
        }
        cfg.sector_size = (uint32_t)v;
      } else if (a == "--threshold")
        cfg.repair_download_threshold = std::stod(next(i));
      else if (a == "--key")
        key_hex = next(i);
      else if (a == "--seed")
        cfg.seed = std::stoull(next(i));
      else if (a == "--io-threads")
        cfg.io_threads = std::stoi(next(i));
      else if (a == "--timeout")
        cfg.host_timeout = std::chrono::milliseconds(std::stoll(next(i)));
      else if (a == "--retries")
        retries = std::stoi(next(i));
      else if (a == "--log-level")
        log_level = next(i);
      else if (a == "-h" || a == "--help") {
        usage();
        return 0;
      } else if (!a.empty() && a[0] == '-') {
        std::cerr << "unknown option " << a << std::endl;
        return 1;
      } else
        local = a;
    } catch (const std::exception &) {
      std::cerr << "bad value for " << a << std::endl;
      return 1;
    }
  }

  if (local.empty() || hosts.empty()) {
    usage();
    return 1;
  }
  if (!parse_log_level(log_level, cfg.log_level)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(cfg.log_level);

  cfg.key = hex_to_bytes(key_hex);
  if (cfg.key.size() != 32) {
    std::cerr << "--key must be 64 hex digits" << std::endl;
    return 1;
  }
  cfg.hosts = split_list(hosts, ',');
  std::string err;
  if (!cfg.validate(err)) {
    std::cerr << err << std::endl;
    return 1;
  }

  std::ifstream in(local, std::ios::binary | std::ios::ate);
  if (!in) {
    std::cerr << "cannot open " << local << std::endl;
    return 1;
  }
  if (path.empty()) {
    auto pos = local.rfind('/');
    path = "/" + (pos == std::string::npos ? local : local.substr(pos + 1));
  }

  FileInfo info;
  info.path = path;
  info.local_path = local;
  info.file_size = (uint64_t)in.tellg();
  info.plan = ErasurePlan{cfg.min_sectors, cfg.total_sectors, cfg.sector_size};
  info.key = cfg.key;

  FileSet files;
  auto entry = files.create(info, err);
  if (!entry) {
    std::cerr << "cannot register " << path << ": " << err << std::endl;
    return 1;
  }

  StorageClient client(cfg, files, nullptr);
  for (auto &h : cfg.hosts) {
    std::string host;
    uint16_t port;
    if (!parse_host_port(h, host, port)) {
      std::cerr << "bad host " << h << std::endl;
      return 1;
    }
    client.add_worker(
        std::unique_ptr<HostSession>(new TcpHostSession(host, port, cfg.host_timeout)));
  }
  client.start();

  Logger::instance().log(LogLevel::INFO,
                         "uploading %s as %s: %llu bytes, %llu segments",
                         local.c_str(), path.c_str(),
                         (unsigned long long)entry->file_size(),
                         (unsigned long long)entry->num_segments());
  client.upload_file(path);
  for (int round = 0;; round++) {
    while (!client.wait_idle(std::chrono::seconds(1)))
      Logger::instance().log(LogLevel::DEBUG, "%zu segments queued, %zu pending",
                             client.upload_heap().size(),
                             client.upload_heap().pending_count());
    if (round >= retries || entry->num_stuck_segments() == 0)
      break;
    Logger::instance().log(LogLevel::INFO, "retrying %llu stuck segments",
                           (unsigned long long)entry->num_stuck_segments());
    client.upload_file(path, true);
  }
  client.stop();
  if (client.stuck_repairs())
    Logger::instance().log(LogLevel::INFO, "%llu stuck segments repaired",
                           (unsigned long long)client.stuck_repairs());

  for (uint64_t i = 0; i < entry->num_segments(); i++) {
    std::cout << "segment " << i << ": " << entry->sectors(i).size() << "/"
              << cfg.total_sectors << " sectors"
              << (entry->stuck(i) ? " stuck" : "") << "\n";
  }
  return entry->num_stuck_segments() ? 2 : 0;
}
