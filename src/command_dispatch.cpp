// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// - See command_dispatch.hpp for API contracts and exit codes.
// - See tests/test_dispatch.cpp for runnable cases against a scripted device.
//
// Style: no exceptions; every failure becomes one status line.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"

#include <cstdio>
#include <cstdlib>               // strtol for safe string->number parsing

namespace v5link {

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_u8(const std::string& s, uint8_t& out) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 0);
    if (!e || *e) return false;            // leftover junk
    if (v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

static std::string hex2(uint8_t b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

static bool fail(ConnectionError e, std::string& line, ConnectionError& err) {
    err  = e;
    line = "status=error " + describe(e);
    return false;
}

static bool bad_arg(const char* what, std::string& line, ConnectionError& err) {
    err  = ConnectionError::of(ErrorKind::Encode);
    line = std::string("status=error reason=bad_value:") + what;
    return false;
}

// ---------- name mapping ----------

bool name_to_kind(const std::string& name, CommandKind& out) {
    if      (name == "version") out = CommandKind::GET_VERSION;
    else if (name == "kv-get")  out = CommandKind::KV_GET;
    else if (name == "kv-set")  out = CommandKind::KV_SET;
    else if (name == "erase")   out = CommandKind::ERASE_FILE;
    else if (name == "run")     out = CommandKind::RUN_FILE;
    else if (name == "stop")    out = CommandKind::STOP_FILE;
    else return false;
    return true;
}

const char* kind_name(CommandKind k) {
    switch (k) {
        case CommandKind::GET_VERSION: return "version";
        case CommandKind::KV_GET:      return "kv-get";
        case CommandKind::KV_SET:      return "kv-set";
        case CommandKind::ERASE_FILE:  return "erase";
        case CommandKind::RUN_FILE:    return "run";
        case CommandKind::STOP_FILE:   return "stop";
    }
    return "unknown";
}

bool parse_vendor(const std::string& s, FileVendor& out) {
    if (s == "user") { out = FileVendor::User; return true; }
    if (s == "sys")  { out = FileVendor::Sys;  return true; }
    if (s == "vex")  { out = FileVendor::Vex;  return true; }
    uint8_t v = 0;
    if (!parse_u8(s, v)) return false;
    out = static_cast<FileVendor>(v);
    return true;
}

// ---------- dispatcher ----------

bool run_command(Connection& conn, CommandKind kind, const DispatchArgs& args,
                 std::string& line, ConnectionError& err) {
    err = ConnectionError::none();

    switch (kind) {
        case CommandKind::GET_VERSION: {
            GetSystemVersion cmd;
            cmd.opts = args.opts;
            SystemVersion ver;
            if (auto e = conn.execute_command(cmd, ver); !e.ok()) return fail(e, line, err);
            line = std::string("status=ok product=") + product_name(ver.product_type) +
                   " version=" + ver.version.to_string() + " flags=" + hex2(ver.flags);
            return true;
        }

        case CommandKind::KV_GET: {
            if (args.key.empty()) return bad_arg("key", line, err);
            KeyValueLoad cmd;
            cmd.key  = args.key;
            cmd.opts = args.opts;
            std::string value;
            if (auto e = conn.execute_command(cmd, value); !e.ok()) return fail(e, line, err);
            line = "status=ok key=" + args.key + " value=" + value;
            return true;
        }

        case CommandKind::KV_SET: {
            if (args.key.empty()) return bad_arg("key", line, err);
            KeyValueSave cmd;
            cmd.key   = args.key;
            cmd.value = args.value;
            cmd.opts  = args.opts;
            Unit none;
            if (auto e = conn.execute_command(cmd, none); !e.ok()) return fail(e, line, err);
            line = "status=ok key=" + args.key + " value=" + args.value;
            return true;
        }

        case CommandKind::ERASE_FILE: {
            if (args.file.empty()) return bad_arg("file", line, err);
            EraseFile cmd;
            if (!parse_vendor(args.vendor, cmd.vendor)) return bad_arg("vendor", line, err);
            cmd.file_name = args.file;
            cmd.opts      = args.opts;
            Unit none;
            if (auto e = conn.execute_command(cmd, none); !e.ok()) return fail(e, line, err);
            line = "status=ok erased=" + args.file;
            return true;
        }

        case CommandKind::RUN_FILE:
        case CommandKind::STOP_FILE: {
            if (args.file.empty()) return bad_arg("file", line, err);
            LoadFileAction cmd;
            if (!parse_vendor(args.vendor, cmd.vendor)) return bad_arg("vendor", line, err);
            cmd.file_name = args.file;
            cmd.action    = (kind == CommandKind::RUN_FILE) ? FileLoadAction::Run : FileLoadAction::Stop;
            cmd.opts      = args.opts;
            Unit none;
            if (auto e = conn.execute_command(cmd, none); !e.ok()) return fail(e, line, err);
            line = std::string("status=ok action=") + kind_name(kind) + " file=" + args.file;
            return true;
        }
    }
    return fail(ConnectionError::of(ErrorKind::Encode), line, err);
}

int exit_code_for(const ConnectionError& err) {
    switch (err.kind) {
        case ErrorKind::Ok:            return 0;
        case ErrorKind::Encode:        return 2;
        case ErrorKind::Timeout:       return 3;
        case ErrorKind::Nack:          return 4;
        case ErrorKind::Decode:
        case ErrorKind::InvalidMagic:
        case ErrorKind::InvalidDevice: return 5;
        default:                       return 1;
    }
}

} // namespace v5link
