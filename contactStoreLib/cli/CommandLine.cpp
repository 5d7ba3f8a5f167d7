/// @file CommandLine.cpp
/// @brief Thin front end over ContactBook

#include <contactstore/Error.hpp>
#include <contactstore/cli/CommandLine.hpp>
#include <contactstore/repository/ContactBook.hpp>
#include <contactstore/util/Log.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <ostream>

namespace ContactStore::cli {

namespace fs = std::filesystem;

namespace {

/// @brief Subcommands and options that parseCommandLine() inspects after parsing
struct AppHandles {
    CLI::App* add = nullptr;
    CLI::App* remove = nullptr;
    CLI::App* list = nullptr;
    CLI::App* find = nullptr;
    CLI::App* help = nullptr;
    CLI::Option* phone = nullptr;
};

/// @brief Declares the contacts command line on app, binding values into out
AppHandles buildApp(CLI::App& app, CommandLine& out, std::string& phone) {
    AppHandles h;
    app.require_subcommand(1);
    app.footer("\nCommands:\n"
               "  add NAME EMAIL [--phone PHONE]  Add a contact\n"
               "  remove ID                       Remove a contact by id\n"
               "  list                            List all contacts\n"
               "  find QUERY                      Find contacts by name or email substring\n"
               "\nThe data file defaults to $CONTACTS_FILE, then " +
               std::string(kDefaultDataFile) + ".");

    app.add_option("-f,--file", out.file, "Data file");
    app.add_flag("-v,--verbose", out.verbose, "Debug logging to stderr");

    h.add = app.add_subcommand("add", "Add a contact");
    h.add->add_option("name", out.name, "Contact name")->required();
    h.add->add_option("email", out.email, "Contact email")->required();
    h.phone = h.add->add_option("-p,--phone", phone, "Phone number");

    h.remove = app.add_subcommand("remove", "Remove a contact by id");
    h.remove->add_option("id", out.id, "Contact id")->required();

    h.list = app.add_subcommand("list", "List all contacts");

    h.find = app.add_subcommand("find", "Find contacts by name or email substring");
    h.find->add_option("query", out.query, "Substring to search for")->required();

    h.help = app.add_subcommand("help", "Show this help");

    // --file, --verbose 는 subcommand 뒤에 와도 부모 app이 받는다.
    for (CLI::App* sub : {h.add, h.remove, h.list, h.find, h.help})
        sub->fallthrough();
    return h;
}

void reportStoreError(std::ostream& err, const std::error_code& ec, const ErrorInfo& info) {
    err << "error: " << ec.message();
    if (!info.operation.empty())
        err << ": " << info.message();
    err << '\n';
}

} // namespace

bool parseCommandLine(const std::vector<std::string>& args, CommandLine& out, std::string& error) {
    out = CommandLine();
    error.clear();

    CLI::App app{"Manage a contact list stored in a JSON file", "contacts"};
    std::string phone;
    const AppHandles h = buildApp(app, out, phone);

    // CLI::App::parse(vector&)는 인자를 역순으로 받는다.
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app.parse(reversed);
    } catch (const CLI::CallForHelp&) {
        out.command = Command::Help;
        return true;
    } catch (const CLI::ParseError& e) {
        error = e.what();
        return false;
    }

    if (h.add->parsed()) {
        out.command = Command::Add;
        if (h.phone->count() > 0)
            out.phone = phone;
    } else if (h.remove->parsed()) {
        out.command = Command::Remove;
    } else if (h.list->parsed()) {
        out.command = Command::List;
    } else if (h.find->parsed()) {
        out.command = Command::Find;
    } else {
        out.command = Command::Help;
    }
    return true;
}

std::string resolveDataPath(const std::string& explicitFile) {
    std::string path = explicitFile;
    if (path.empty()) {
        const char* env = std::getenv("CONTACTS_FILE");
        path = (env && *env) ? env : kDefaultDataFile;
    }
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    return ec ? path : canonical.string();
}

std::string usage(const std::string& program) {
    CLI::App app{"Manage a contact list stored in a JSON file", program};
    CommandLine unused;
    std::string phone;
    buildApp(app, unused, phone);
    return app.help();
}

int run(const CommandLine& cmd, std::ostream& out, std::ostream& err) {
    if (cmd.command == Command::Help || cmd.command == Command::None) {
        out << usage("contacts");
        return cmd.command == Command::Help ? 0 : 2;
    }
    if (cmd.verbose)
        log::setLevel(log::Level::Debug);

    const std::string path = resolveDataPath(cmd.file);
    CONTACTSTORE_LOG_DEBUG("using data file '" << path << "'");

    std::error_code ec;
    ErrorInfo info;
    ContactBook book(path, ec, &info);
    if (ec) {
        reportStoreError(err, ec, info);
        return 1;
    }

    switch (cmd.command) {
    case Command::Add: {
        auto added = book.add(cmd.name, cmd.email, cmd.phone, ec);
        if (!added) {
            err << "error: " << ec.message() << '\n';
            return 1;
        }
        out << "Adding contact: " << added->name << " <" << added->email << ">\n";
        if (!book.save(ec, &info)) {
            reportStoreError(err, ec, info);
            return 1;
        }
        out << "Saved.\n";
        return 0;
    }
    case Command::Remove:
        if (!book.remove(cmd.id)) {
            out << "No contact with id " << cmd.id << '\n';
            return 0;
        }
        if (!book.save(ec, &info)) {
            reportStoreError(err, ec, info);
            return 1;
        }
        out << "Removed contact " << cmd.id << '\n';
        return 0;
    case Command::List:
        for (const auto& c : book.list()) {
            out << c.id << " | " << c.name << " | " << c.email;
            if (c.phone)
                out << " | " << *c.phone;
            out << '\n';
        }
        out << "Total: " << book.list().size() << '\n';
        return 0;
    case Command::Find: {
        const auto found = book.find(cmd.query);
        for (const auto& c : found)
            out << c.name << " - " << (c.phone ? *c.phone : std::string("No phone")) << '\n';
        out << "Found: " << found.size() << '\n';
        return 0;
    }
    default:
        break;
    }
    return 2;
}

} // namespace ContactStore::cli
