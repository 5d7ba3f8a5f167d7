#pragma once
/// @file CommandLine.hpp
/// @brief Argument parsing and command dispatch for the `contacts` tool

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ContactStore::cli {

enum class Command { None, Add, Remove, List, Find, Help };

/// @brief Parsed invocation
struct CommandLine {
    std::string file;     ///< --file value, empty when not given
    bool verbose = false; ///< --verbose
    Command command = Command::None;

    // add
    std::string name;
    std::string email;
    std::optional<std::string> phone;

    // remove
    std::string id;

    // find
    std::string query;
};

/// @brief Default data file when neither --file nor CONTACTS_FILE is set
constexpr const char* kDefaultDataFile = "contacts.json";

/// @brief Parses arguments (without argv[0])
/// @param error Receives a one-line message on failure
/// @return false on a usage error
bool parseCommandLine(const std::vector<std::string>& args, CommandLine& out, std::string& error);

/// @brief Data file path: explicit value, else $CONTACTS_FILE, else kDefaultDataFile
/// @details Canonicalized when the file already exists, returned as given otherwise.
std::string resolveDataPath(const std::string& explicitFile);

std::string usage(const std::string& program);

/// @brief Executes a parsed command against the data file
/// @return Process exit code: 0 on success, 1 on a store or validation error
int run(const CommandLine& cmd, std::ostream& out, std::ostream& err);

} // namespace ContactStore::cli
