#pragma once
/**
 * @file command_dispatch.hpp
 * @brief Central command dispatcher: CLI verbs in, one status line out.
 *
 * @details
 * PURPOSE
 * -------
 * main.cpp should not know how a key-value read or a program start is put on
 * the wire. It resolves the user's flag to a CommandKind, fills a
 * DispatchArgs, and calls run_command(). The dispatcher builds the typed
 * command (commands.hpp), runs it on the Connection and renders the result
 * as a single shell-friendly line:
 *
 *   status=ok product=brain version=1.1.3.b0 flags=0x00
 *   status=ok key=teamnumber value=1234A
 *   status=error reason=nack code=0xdb ack=nack_file_already_exists
 *
 * PROCESS FLOW
 * ------------
 * 1. CLI args parsed in main.cpp (e.g. `--kv-set teamnumber 1234A`).
 * 2. main.cpp maps the chosen flag to its verb and calls `name_to_kind("kv-set", kind)`.
 * 3. main.cpp calls `run_command(conn, kind, args, line, err)`.
 * 4. The dispatcher validates arguments, builds KeyValueSave, and runs it.
 * 5. `line` is printed; `err` picks the exit code via exit_code_for().
 *
 * EXIT CODES
 * ----------
 *   0 ok, 1 link failure, 2 bad arguments, 3 timeout,
 *   4 device refused (nack), 5 unreadable or unknown device reply,
 *   6 nothing found (scan only)
 *
 * MAINTENANCE
 * -----------
 * When adding a command:
 *   1) Add the command object in commands.hpp/cpp.
 *   2) Extend CommandKind and name_to_kind().
 *   3) Extend run_command() with argument checks and output rendering.
 *
 * @note Errors are surfaced with stable strings like "bad_value:vendor" or
 *       the ErrorKind reason, so scripts can act on them.
 */

#include "commands.hpp"
#include "v5link/connection.hpp"
#include "v5link/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace v5link {

/**
 * @enum CommandKind
 * @brief Every operation the CLI can ask of a device.
 */
enum class CommandKind {
    GET_VERSION,   ///< product type and firmware version
    KV_GET,        ///< read a system key-value entry
    KV_SET,        ///< write a system key-value entry
    ERASE_FILE,    ///< delete a file from flash
    RUN_FILE,      ///< start a program
    STOP_FILE,     ///< stop a running program
};

/// Arguments shared by all commands. Unused fields are ignored.
struct DispatchArgs {
    std::string key;
    std::string value;
    std::string file;
    std::string vendor{"user"};   ///< "user" | "sys" | "vex" | 0..255
    CommandOptions opts;
};

/// "version" | "kv-get" | "kv-set" | "erase" | "run" | "stop". false on anything else.
bool name_to_kind(const std::string& name, CommandKind& out);

const char* kind_name(CommandKind k);

/// Vendor names or a raw byte (decimal or 0x hex).
bool parse_vendor(const std::string& s, FileVendor& out);

/**
 * @brief Run one command and render its status line.
 *
 * @param line  "status=ok ..." or "status=error reason=..." (always set).
 * @param err   the failure, ok() on success. Argument errors are Encode.
 * @return true on success.
 */
bool run_command(Connection& conn, CommandKind kind, const DispatchArgs& args,
                 std::string& line, ConnectionError& err);

/// Exit code for a failed (or ok) command, see EXIT CODES above.
int exit_code_for(const ConnectionError& err);

} // namespace v5link
