#include <fmt/core.h>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "bundle_reader.hpp"
#include "disassemble.hpp"
#include "fault.hpp"
#include "instruction_sink.hpp"
#include "machine.hpp"
#include "parse_module_json.hpp"
#include "trace.hpp"

struct CommandLineArgs {
    std::optional<std::string> format;
    std::optional<size_t> max_steps;
    bool trace = false;
    bool disassemble = false;
    std::string module_file;
};

static void print_usage() {
    fmt::print(stderr, "Usage: kumo-run [OPTIONS] MODULE_FILE\n");
    fmt::print(stderr, "Options:\n");
    fmt::print(stderr, "  -t, --trace             Print every executed instruction and the top of stack\n");
    fmt::print(stderr, "  -d, --disassemble       List the instructions of every function instead of running\n");
    fmt::print(stderr, "  --max-steps N, --max-steps=N\n");
    fmt::print(stderr, "                          Fault after N instructions\n");
    fmt::print(stderr, "  --format NAME, --format=NAME\n");
    fmt::print(stderr, "                          Module file format: bin, json or bundle\n");
}

static size_t parse_count(const std::string& text, const char* option) {
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", option, text);
        std::exit(1);
    }
    return n;
}

// Parse command-line arguments according to: kumo-run [OPTIONS] MODULE_FILE.
CommandLineArgs parse_args(int argc, char* argv[]) {
    CommandLineArgs args;
    int i = 1;

    // Parse options.
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-t" || arg == "--trace") {
            args.trace = true;
            i++;
        }
        else if (arg == "-d" || arg == "--disassemble") {
            args.disassemble = true;
            i++;
        }
        else if (arg.rfind("--max-steps=", 0) == 0) {
            args.max_steps = parse_count(arg.substr(12), "--max-steps");  // Length of "--max-steps=".
            i++;
        }
        else if (arg == "--max-steps") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --max-steps option requires an argument\n");
                std::exit(1);
            }
            args.max_steps = parse_count(argv[i + 1], "--max-steps");
            i += 2;
        }
        else if (arg.rfind("--format=", 0) == 0) {
            args.format = arg.substr(9);  // Length of "--format=".
            i++;
        }
        else if (arg == "--format") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --format option requires an argument\n");
                std::exit(1);
            }
            args.format = argv[i + 1];
            i += 2;
        }
        // Stop at first non-option argument (the module file).
        else if (arg.empty() || arg[0] != '-') {
            break;
        }
        else {
            fmt::print(stderr, "Error: Unknown option '{}'\n", arg);
            std::exit(1);
        }
    }

    // Next argument is the module file (required).
    if (i >= argc) {
        fmt::print(stderr, "Error: Missing MODULE_FILE argument\n");
        print_usage();
        std::exit(1);
    }
    args.module_file = argv[i++];

    if (i < argc) {
        fmt::print(stderr, "Error: Unexpected argument '{}'\n", argv[i]);
        print_usage();
        std::exit(1);
    }

    return args;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string guess_format(const std::string& path) {
    if (ends_with(path, ".json")) {
        return "json";
    } else if (ends_with(path, ".bundle") || ends_with(path, ".db")) {
        return "bundle";
    }
    return "bin";
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("Cannot open module file '{}'", path));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static kumo::Module load_module(const std::string& path, const std::string& format) {
    if (format == "bundle") {
        kumo::BundleReader reader(path);
        return reader.read_module();
    }
    std::vector<uint8_t> bytes = read_file(path);
    if (format == "json") {
        return kumo::parse_module_json(std::string(bytes.begin(), bytes.end()));
    } else if (format == "bin") {
        return kumo::Module::decode_container(bytes);
    }
    throw std::runtime_error(fmt::format("Unknown module format '{}'", format));
}

int main(int argc, char* argv[]) {
    try {
        CommandLineArgs args = parse_args(argc, argv);

        std::string format = args.format ? *args.format : guess_format(args.module_file);
        if constexpr (kumo::TRACE_MAIN) {
            fmt::print("Loading {} as {}\n", args.module_file, format);
        }
        auto module = std::make_shared<const kumo::Module>(load_module(args.module_file, format));

        if (args.disassemble) {
            for (size_t i = 0; i < module->size(); i++) {
                fmt::print("function {}:\n", i);
                for (const auto& line : kumo::disassemble(*module->find_function(i))) {
                    fmt::print("  {}\n", line);
                }
            }
            return 0;
        }

        kumo::MachineOptions options;
        if (args.max_steps) {
            options.max_steps = *args.max_steps;
        }
        kumo::Machine machine(module, options);

        kumo::PrintingSink printing_sink;
        if (args.trace) {
            machine.set_sink(printing_sink);
        }

        kumo::Value result = machine.run();
        fmt::print("{}\n", kumo::value_to_string(result));
        return 0;

    } catch (const kumo::MachineFault& e) {
        fmt::print(stderr, "Fault: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
