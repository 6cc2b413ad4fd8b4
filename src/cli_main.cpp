#include <cxxopts.hpp>
#include <iostream>
#include <sstream>
#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/FileIO.hpp"
#include "jpatch/Parse.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/Serialize.hpp"

using namespace jpatch;

namespace {

// "-" reads the document from stdin as JSON
Element read_document(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return parse_document(ss.str(), "<stdin>");
    }
    return load_document(path);
}

void report(const PatchError& err) {
    std::cerr << "Error: ";
    if (err.operation_index()) {
        std::cerr << "operation " << *err.operation_index() << ": ";
    }
    std::cerr << err.what() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jpatch", "Apply RFC 6902 JSON Patches to JSON/TOML documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("d,document", "Path to JSON/TOML document ('-' for stdin)", cxxopts::value<std::string>())
            ("p,patch", "Path to JSON patch file", cxxopts::value<std::string>())
            ("o,out", "Write the result to FILE (.json or .toml) instead of stdout", cxxopts::value<std::string>())
            ("indent", "Spaces per indentation level, -1 for compact", cxxopts::value<int>()->default_value("2"))
            ("relative-to", "Pointer prefixed to every path and from", cxxopts::value<std::string>())
            ("partial", "Keep operations applied before a failing one")
            ("v,verbose", "Report each applied operation on stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: apply | validate | get POINTER | add POINTER VALUE | remove POINTER"
                         " | replace POINTER VALUE | move FROM POINTER | copy FROM POINTER"
                         " | test POINTER VALUE\n";
            return 0;
        }

        const bool verbose = result.count("verbose") > 0;
        SerializeOptions format;
        format.indent = result["indent"].as<int>();

        ApplyOptions apply_options;
        if (result.count("relative-to")) {
            apply_options.relative_to = Pointer::parse(result["relative-to"].as<std::string>());
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() != want) {
                std::cerr << "Error: command '" << cmd << "' takes " << (want - 1) << " argument(s)\n";
                return false;
            }
            return true;
        };

        auto require = [&](const char* name) {
            if (!result.count(name)) {
                std::cerr << "Error: --" << name << " must be provided for `" << cmd << "`\n";
                return false;
            }
            return true;
        };

        auto emit = [&](const Element& doc) {
            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                write_document(out, doc, format);
                if (verbose) std::cerr << "Wrote " << out << "\n";
            } else {
                std::cout << serialize(doc, format) << "\n";
            }
        };

        // VALIDATE
        if (cmd == "validate") {
            if (!expect_args(1) || !require("patch")) return 1;
            const Patch patch = load_patch(result["patch"].as<std::string>());
            for (size_t i = 0; i < patch.size(); ++i) {
                std::cout << i << ": " << patch.operations()[i].to_json().dump() << "\n";
            }
            std::cout << patch.size() << " operation(s)\n";
            return 0;
        }

        if (!require("document")) return 1;
        const Element document = read_document(result["document"].as<std::string>());

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return 1;
            Pointer pointer = Pointer::parse(cmdv[1]);
            if (apply_options.relative_to) pointer = apply_options.relative_to->concat(pointer);
            const Document doc(document);
            std::cout << serialize(doc.resolve(pointer), format) << "\n";
            return 0;
        }

        // APPLY
        Patch patch;
        if (cmd == "apply") {
            if (!expect_args(1) || !require("patch")) return 1;
            patch = load_patch(result["patch"].as<std::string>());
        } else if (cmd == "add" || cmd == "replace" || cmd == "test") {
            if (!expect_args(3)) return 1;
            Pointer path = Pointer::parse(cmdv[1]);
            Element value = parse_value(cmdv[2]);
            if (cmd == "add") patch = Patch(std::vector<Operation>{Operation::add(std::move(path), std::move(value))});
            else if (cmd == "replace") patch = Patch(std::vector<Operation>{Operation::replace(std::move(path), std::move(value))});
            else patch = Patch(std::vector<Operation>{Operation::test(std::move(path), std::move(value))});
        } else if (cmd == "remove") {
            if (!expect_args(2)) return 1;
            patch = Patch(std::vector<Operation>{Operation::remove(Pointer::parse(cmdv[1]))});
        } else if (cmd == "move" || cmd == "copy") {
            if (!expect_args(3)) return 1;
            Pointer from = Pointer::parse(cmdv[1]);
            Pointer path = Pointer::parse(cmdv[2]);
            if (cmd == "move") patch = Patch(std::vector<Operation>{Operation::move(std::move(from), std::move(path))});
            else patch = Patch(std::vector<Operation>{Operation::copy(std::move(from), std::move(path))});
        } else {
            std::cerr << "Error: unknown command '" << cmd << "'\n";
            return 1;
        }

        if (verbose) {
            apply_options.on_applied = [](size_t index, const Operation& op) {
                std::cerr << "[" << index << "] " << op.to_json().dump() << "\n";
            };
        }

        if (result.count("partial")) {
            Element patched = document;
            try {
                patch.apply_in_place(patched, apply_options);
            } catch (const PatchError& err) {
                report(err);
                // Operations before the failing one are kept
                emit(patched);
                return 1;
            }
            emit(patched);
        } else {
            emit(patch.apply(document, apply_options));
        }

        if (verbose) std::cerr << "Applied " << patch.size() << " operation(s)\n";
        return 0;

    } catch (const PatchError& err) {
        report(err);
        return 1;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
