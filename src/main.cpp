#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "CLI/CLI.hpp"

#include "command_dispatch.hpp"   // run_command(), exit_code_for()
#include "device_registry.hpp"    // discover_devices(), save_registry()
#include "v5link/config.hpp"      // LinkConfig, load_config()
#include "v5link/log.hpp"
#include "v5link/transport/transport_linux_serial.hpp"

int main(int argc, char** argv) {
  CLI::App app{"V5 device link CLI"};

  v5link::LinkConfig cfg;
  std::string config_path;

  // ---- commands ----
  bool get_version=false, do_scan=false;
  std::string kv_get, erase_file, run_file, stop_file;
  std::vector<std::string> kv_set;      // --kv-set <key> <value>

  // ---- targeting / device ----
  std::string dev, user_dev, registry_path, vendor="user";
  CLI::Option* opt_dev = app.add_option("--dev", dev, "System port (e.g. /dev/serial/by-id/...-if00)");
  app.add_option("--user-dev", user_dev, "User port for program I/O");
  app.add_option("--config", config_path, "JSON config file");

  // ---- io settings (unset means: config file, then defaults) ----
  int timeout_ms=-1, baud=-1, boot_delay_ms=-1, retries=-1;
  std::string log_level;

  app.add_flag("--version", get_version, "Query product type and firmware version");
  app.add_option("--kv-get", kv_get, "Read a key-value entry");
  app.add_option("--kv-set", kv_set, "Write a key-value entry: --kv-set <key> <value>")->expected(2);
  app.add_option("--erase", erase_file, "Erase a file from flash");
  app.add_option("--run", run_file, "Run a program by file name");
  app.add_option("--stop", stop_file, "Stop a program by file name");
  app.add_option("--vendor", vendor, "File vendor: user|sys|vex|<0..255>");

  app.add_flag("--scan", do_scan, "Scan and list devices, saves registry");
  app.add_option("--registry", registry_path, "With --scan: registry file (default ~/.config/v5link/devices.json)");

  app.add_option("--timeout", timeout_ms, "Reply timeout per attempt (ms)");
  app.add_option("--retries", retries, "Attempts per command");
  app.add_option("--baud", baud, "Baud rate (default 115200)");
  app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms) to let USB reset");
  app.add_option("--log-level", log_level, "debug|info|warn|error|off")
      ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));

  CLI11_PARSE(app, argc, argv);

  // -------- settings: defaults < config file < flags --------
  if (!config_path.empty()) {
    std::string err;
    if (!v5link::load_config(config_path, cfg, err)) {
      std::cerr << "status=error reason=config " << "detail=" << err << "\n";
      return 2;
    }
  }
  if (opt_dev->count() > 0)  cfg.device        = dev;
  if (!user_dev.empty())     cfg.user_device   = user_dev;
  if (timeout_ms >= 0)       cfg.timeout_ms    = timeout_ms;
  if (retries >= 0)          cfg.retries       = retries;
  if (baud > 0)              cfg.baud          = baud;
  if (boot_delay_ms >= 0)    cfg.boot_delay_ms = boot_delay_ms;
  if (!log_level.empty())    cfg.log_level     = log_level;

  v5link::log::Level lvl = v5link::log::Level::Warn;
  if (!v5link::log::parse_level(cfg.log_level, lvl)) {
    std::cerr << "status=error reason=bad_value:log_level\n";
    return 2;
  }
  v5link::log::set_level(lvl);

  // -------- scan mode --------
  if (do_scan) {
    auto devices = v5link::discover_devices(cfg);
    int online = 0;
    for (const auto& d : devices) {
      std::cout << "dev=" << d.system_path
                << " user=" << (d.user_path.empty() ? "-" : d.user_path)
                << " product=" << (d.product.empty() ? "-" : d.product)
                << " version=" << (d.version.empty() ? "-" : d.version)
                << " online=" << (d.online ? 1 : 0) << "\n";
      if (d.online) ++online;
    }
    std::string err;
    const std::string path = registry_path.empty() ? v5link::default_registry_path() : registry_path;
    if (!v5link::save_registry(devices, path, err)) {
      std::cerr << "status=error reason=registry detail=" << err << " path=" << path << "\n";
      return 1;
    }
    return online > 0 ? 0 : 6;
  }

  // -------- choose exactly one command --------
  int cmds = 0;
  cmds += get_version ? 1 : 0;
  cmds += (!kv_get.empty()) ? 1 : 0;
  cmds += (kv_set.size()==2) ? 1 : 0;
  cmds += (!erase_file.empty()) ? 1 : 0;
  cmds += (!run_file.empty()) ? 1 : 0;
  cmds += (!stop_file.empty()) ? 1 : 0;

  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  v5link::DispatchArgs args;
  args.vendor       = vendor;
  args.opts.timeout = std::chrono::milliseconds(cfg.timeout_ms);
  args.opts.retries = static_cast<std::size_t>(cfg.retries);

  std::string verb = "version";
  if (!kv_get.empty())          { verb = "kv-get"; args.key = kv_get; }
  else if (kv_set.size() == 2)  { verb = "kv-set"; args.key = kv_set[0]; args.value = kv_set[1]; }
  else if (!erase_file.empty()) { verb = "erase";  args.file = erase_file; }
  else if (!run_file.empty())   { verb = "run";    args.file = run_file; }
  else if (!stop_file.empty())  { verb = "stop";   args.file = stop_file; }

  v5link::CommandKind kind;
  if (!v5link::name_to_kind(verb, kind)) {
    std::cerr << "status=error reason=unknown_command cmd=" << verb << "\n";
    return 2;
  }
  v5link::log::debug("dispatch", std::string("cmd=") + v5link::kind_name(kind));

  // -------- open the link --------
  v5link::Connection conn(std::make_unique<v5link::transport::LinuxSerial>(cfg.device, cfg.user_device));
  v5link::transport::Config tcfg;
  tcfg.baud          = cfg.baud;
  tcfg.boot_delay_ms = cfg.boot_delay_ms;

  if (auto e = conn.open(tcfg); !e.ok()) {
    std::cerr << "status=error " << v5link::describe(e) << " dev=" << cfg.device << "\n";
    return 1;
  }

  // -------- run via dispatcher --------
  std::string line;
  v5link::ConnectionError err;
  if (!v5link::run_command(conn, kind, args, line, err)) {
    std::cerr << line << "\n";
    return v5link::exit_code_for(err);
  }

  std::cout << line << "\n";
  return 0;
}
