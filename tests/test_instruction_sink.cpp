#include <catch2/catch_test_macros.hpp>
#include "../src/instruction_sink.hpp"
#include "../src/machine.hpp"
#include "bytecode_builder.hpp"
#include <cstdio>
#include <string>
#include <vector>

using namespace kumo;
using kumo::test::Bytecode;
using kumo::test::make_module;

// Reads back everything written to a temporary file, one entry per line.
static std::vector<std::string> read_lines(std::FILE* file) {
    std::vector<std::string> lines;
    std::rewind(file);
    std::string line;
    int c;
    while ((c = std::fgetc(file)) != EOF) {
        if (c == '\n') {
            lines.push_back(line);
            line.clear();
        } else {
            line.push_back(static_cast<char>(c));
        }
    }
    REQUIRE(line.empty());
    return lines;
}

TEST_CASE("Printing sink writes one line per instruction", "[trace]") {
    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    Bytecode code;
    code.load_string("s").pop().load_float(2.5).load_regex("a+", "g").pop().ret();

    PrintingSink sink(out);
    Machine machine(make_module({code.bytes()}));
    machine.set_sink(sink);
    REQUIRE(as_float(machine.run()) == 2.5);

    std::vector<std::string> expected = {
        "LOAD_STRING \"s\"",
        "POP <empty>",
        "LOAD_FLOAT64 2.5",
        "LOAD_REGEX /a+/g",
        "POP 2.5",
        "RETURN <empty>",
    };
    REQUIRE(read_lines(out) == expected);
    std::fclose(out);
}

TEST_CASE("Resetting the sink stops tracing", "[trace]") {
    Bytecode code;
    code.load_null().pop().load_bool(true).ret();

    RecordingSink sink;
    Machine machine(make_module({code.bytes()}));
    machine.set_sink(sink);
    machine.reset_sink();
    REQUIRE(as_bool(machine.run()));
    REQUIRE(sink.entries().empty());
}
