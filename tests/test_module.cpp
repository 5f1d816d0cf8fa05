#include <catch2/catch_test_macros.hpp>
#include "../src/module.hpp"
#include "../src/machine.hpp"
#include "../src/parse_module_json.hpp"
#include "../src/disassemble.hpp"
#include "bytecode_builder.hpp"

using namespace kumo;
using kumo::test::Bytecode;

TEST_CASE("Module needs an entry function", "[module]") {
    REQUIRE_THROWS_AS(Module(std::vector<FunctionObject>{}), ModuleError);
}

TEST_CASE("Module looks functions up by index", "[module]") {
    Module module(std::vector<std::vector<uint8_t>>{{0x05}, {0x07, 0x08}});

    REQUIRE(module.size() == 2);
    REQUIRE(module.entry().code == std::vector<uint8_t>{0x05});
    REQUIRE(module.find_function(1)->code.size() == 2);
    REQUIRE(module.find_function(2) == nullptr);
}

TEST_CASE("Module decodes the binary container", "[module][container]") {
    Bytecode container;
    container.u32(2)
        .u32(2).u8(0x05).u8(0x08)
        .u32(0);

    Module module = Module::decode_container(container.bytes());

    REQUIRE(module.size() == 2);
    REQUIRE(module.entry().code == std::vector<uint8_t>{0x05, 0x08});
    REQUIRE(module.find_function(1)->code.empty());
}

TEST_CASE("Module rejects malformed containers", "[module][container]") {
    SECTION("empty input") {
        REQUIRE_THROWS_AS(Module::decode_container(std::vector<uint8_t>{}), ModuleError);
    }
    SECTION("no functions") {
        Bytecode container;
        container.u32(0);
        REQUIRE_THROWS_AS(Module::decode_container(container.bytes()), ModuleError);
    }
    SECTION("short function body") {
        Bytecode container;
        container.u32(1).u32(4).u8(0x05);
        REQUIRE_THROWS_AS(Module::decode_container(container.bytes()), ModuleError);
    }
    SECTION("missing length") {
        Bytecode container;
        container.u32(2).u32(1).u8(0x05).u8(0x01);
        REQUIRE_THROWS_AS(Module::decode_container(container.bytes()), ModuleError);
    }
    SECTION("trailing bytes") {
        Bytecode container;
        container.u32(1).u32(1).u8(0x05).u8(0x00);
        REQUIRE_THROWS_AS(Module::decode_container(container.bytes()), ModuleError);
    }
}

TEST_CASE("JSON byte arrays load as a single function", "[module][json]") {
    // LOAD_FLOAT64 3.14, RETURN as the compiler writes it.
    Module module = parse_module_json("[2, 31, 133, 235, 81, 184, 30, 9, 64, 8]");

    REQUIRE(module.size() == 1);
    Machine machine(std::make_shared<const Module>(module));
    REQUIRE(as_float(machine.run()) == 3.14);
}

TEST_CASE("JSON arrays of arrays load one function each", "[module][json]") {
    Module nested = parse_module_json("[[11, 1, 0, 8], [5, 8]]");
    REQUIRE(nested.size() == 2);
    REQUIRE(nested.find_function(1)->code == std::vector<uint8_t>{0x05, 0x08});

    Module wrapped = parse_module_json(R"({"functions": [[11, 1, 0, 8], [5, 8]]})");
    REQUIRE(wrapped.size() == 2);
    REQUIRE(wrapped.entry().code == nested.entry().code);

    Machine machine(std::make_shared<const Module>(wrapped));
    REQUIRE(is_null(machine.run()));
}

TEST_CASE("An empty JSON array is an empty entry function", "[module][json]") {
    Module module = parse_module_json("[]");
    REQUIRE(module.size() == 1);
    REQUIRE(module.entry().code.empty());
}

TEST_CASE("JSON modules are validated", "[module][json]") {
    REQUIRE_THROWS_AS(parse_module_json("[1, 2"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json("[1, 256]"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json("[1, -1]"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json("[1, \"2\"]"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json("[[1], 2]"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json(R"({"code": [1]})"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json(R"({"functions": []})"), ModuleError);
    REQUIRE_THROWS_AS(parse_module_json("42"), ModuleError);
}

TEST_CASE("Disassembly lists every instruction", "[disassemble]") {
    Bytecode code;
    code.load_string("hi").load_float(1.5).load_bool(true).pop()
        .load_null().load_regex("a+", "g").load_undefined()
        .store_var("x").load_var("x").call(3).ret();

    std::vector<std::string> lines = disassemble(FunctionObject{code.bytes()});

    std::vector<std::string> expected = {
        "0000 LOAD_STRING \"hi\"",
        "0004 LOAD_FLOAT64 1.5",
        "000d LOAD_BOOL true",
        "000f POP",
        "0010 LOAD_NULL",
        "0011 LOAD_REGEX /a+/g",
        "0017 LOAD_UNDEFINED",
        "0018 STORE_VAR x",
        "001b LOAD_VAR x",
        "001e CALL #3",
        "0021 RETURN",
    };
    REQUIRE(lines == expected);
}

TEST_CASE("Disassembly stops at bad bytes", "[disassemble]") {
    REQUIRE(disassemble(FunctionObject{{0x05, 0xFF, 0x05}}) ==
            std::vector<std::string>{"0000 LOAD_NULL", "0001 <unknown 0xff>"});
    REQUIRE(disassemble(FunctionObject{{0x02, 0x00}}) ==
            std::vector<std::string>{"0000 LOAD_FLOAT64 <truncated>"});
}
