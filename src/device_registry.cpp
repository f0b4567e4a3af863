// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file device_registry.cpp
 */

#include "device_registry.hpp"
#include "v5link/log.hpp"
#include "v5link/transport/transport_linux_serial.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>          // std::sort
#include <cstdlib>            // getenv for XDG/HOME lookups
#include <filesystem>         // walking /dev/serial/by-id, creating the config dir
#include <fstream>            // writing devices.json
#include <map>
#include <memory>
#include <system_error>       // std::error_code for non-throwing filesystem ops
#include <glob.h>             // glob(3) for the ttyACM fallback

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace v5link {

// ---------------------------------------------------------------------------
// Probe-time constants.
// - PROBE_TIMEOUT_MS: one GetSystemVersion attempt per port keeps a scan bounded.
// ---------------------------------------------------------------------------
static constexpr int PROBE_TIMEOUT_MS = 800;

static const char* const SYSTEM_SUFFIX = "-if00";
static const char* const USER_SUFFIX   = "-if02";


// -------- helpers --------

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern to a vector of strings.
 * glob() allocates; always globfree().
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}


// -------- public API --------

std::vector<PortPair> pair_by_id_names(const std::string& dir, const std::vector<std::string>& names) {
    std::map<std::string, PortPair> by_prefix;   // sorted by prefix, hence by system path
    const std::string sys(SYSTEM_SUFFIX), usr(USER_SUFFIX);

    for (const auto& name : names) {
        if (name.find("VEX") == std::string::npos) continue;
        const std::string path = (fs::path(dir) / name).string();
        if (ends_with(name, sys)) {
            by_prefix[name.substr(0, name.size() - sys.size())].system_path = path;
        } else if (ends_with(name, usr)) {
            by_prefix[name.substr(0, name.size() - usr.size())].user_path = path;
        }
    }

    std::vector<PortPair> out;
    for (auto& kv : by_prefix) {
        if (kv.second.system_path.empty()) continue;   // user port without its system port
        out.push_back(std::move(kv.second));
    }
    return out;
}

/*
 * list_candidate_ports()
 * ----------------------
 * Prefer /dev/serial/by-id (stable names that tell Brain from Controller),
 * fall back to globbing ttyACM. Filesystem errors just mean fewer candidates.
 */
std::vector<PortPair> list_candidate_ports() {
    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;

    if (fs::exists(by_id, ec)) {
        std::vector<std::string> names;
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            names.push_back(it->path().filename().string());
        }
        if (ec) log::warn("scan_by_id_failed", "msg=\"" + ec.message() + "\"");
        return pair_by_id_names(by_id.string(), names);
    }

    std::vector<std::string> ttys;
    append_glob(ttys, "/dev/ttyACM*");
    std::sort(ttys.begin(), ttys.end());

    std::vector<PortPair> out;
    for (auto& t : ttys) out.push_back(PortPair{t, {}});
    return out;
}

ConnectionError identify_device(Connection& conn, DeviceInfo& info, const CommandOptions& opts) {
    GetSystemVersion cmd;
    cmd.opts = opts;
    SystemVersion ver;

    ConnectionError e = conn.execute_command(cmd, ver);
    if (!e.ok()) { info.online = false; return e; }

    if (!is_known_product(ver.product_type)) {
        info.online = false;
        log::warn("unknown_product", "type=" + std::to_string(ver.product_type));
        return ConnectionError::of(ErrorKind::InvalidDevice);
    }

    info.product = product_name(ver.product_type);
    info.version = ver.version.to_string();
    info.online  = true;
    return ConnectionError::none();
}

/*
 * discover_devices()
 * ------------------
 * Phases per candidate:
 *   1) open the system port (boot delay from cfg),
 *   2) one GetSystemVersion attempt,
 *   3) close (Connection destructor).
 * Failures are logged and recorded as offline; they never abort the scan.
 */
std::vector<DeviceInfo> discover_devices(const LinkConfig& cfg) {
    std::vector<DeviceInfo> result;

    transport::Config tcfg;
    tcfg.baud          = cfg.baud;
    tcfg.boot_delay_ms = cfg.boot_delay_ms;

    CommandOptions probe;
    probe.timeout = std::chrono::milliseconds(PROBE_TIMEOUT_MS);
    probe.retries = 1;

    for (const auto& port : list_candidate_ports()) {
        DeviceInfo info;
        info.system_path = port.system_path;
        info.user_path   = port.user_path;

        Connection conn(std::make_unique<transport::LinuxSerial>(port.system_path));
        ConnectionError e = conn.open(tcfg);
        if (e.ok()) e = identify_device(conn, info, probe);
        if (!e.ok()) log::info("probe_failed", "dev=" + port.system_path + " " + describe(e));

        result.push_back(std::move(info));
    }
    return result;
}

std::string registry_json(const std::vector<DeviceInfo>& devices) {
    json arr = json::array();
    for (const auto& d : devices) {
        json j;
        j["system_path"] = d.system_path;
        j["user_path"]   = d.user_path;
        j["product"]     = d.product;
        j["version"]     = d.version;
        j["online"]      = d.online;
        arr.push_back(j);
    }
    return arr.dump(2);
}

std::string default_registry_path() {
    fs::path base;
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x) base = fs::path(x);
    else base = fs::path(std::getenv("HOME") ? std::getenv("HOME") : "") / ".config";
    return (base / "v5link" / "devices.json").string();
}

/*
 * save_registry()
 * ---------------
 * Write to <path>.tmp, then rename over <path>, so a reader never sees a
 * half-written file.
 */
bool save_registry(const std::vector<DeviceInfo>& devices, const std::string& path, std::string& err) {
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) { err = "config_dir_failed"; return false; }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) { err = "open_failed"; return false; }
        ofs << registry_json(devices) << "\n";
        if (!ofs) { err = "write_failed"; return false; }
    }

    fs::rename(tmp, target, ec);
    if (ec) { err = "rename_failed"; return false; }
    return true;
}

} // namespace v5link
