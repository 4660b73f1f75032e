#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    cmdtree::App app("check");
    app.description("Fails on purpose when --error is given")
        .flag(cmdtree::Flag("error", cmdtree::FlagType::Bool).alias("e").description("Fail the action"))
        .actionE([](const cmdtree::Context& c) -> std::optional<std::string> {
            if (c.boolFlag("error")) return std::string("ERROR...");
            return std::nullopt;
        });

    std::vector<std::string> args(argv, argv + argc);
    if (const auto err = app.runWithResult(args)) {
        std::cout << *err << "\n";
        return 1;
    }
    std::cout << "OK\n";
    return 0;
}
