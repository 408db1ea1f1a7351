// test_main.cpp - Catch2 entry point; the validator needs an embedded interpreter for the whole run
#include <catch2/catch_session.hpp>
#include <spdlog/spdlog.h>

#include "../src/security/python_interpreter.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    sandcell::node::security::PythonInterpreter interpreter;
    return Catch::Session().run(argc, argv);
}
