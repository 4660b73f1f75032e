#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

int main(int argc, char** argv) {
    cmdtree::App app("greet");
    app.description("Says hello (or bye) to everyone named on the command line")
        .usage("greet [names...] [--bye]")
        .version("0.1.0")
        .flag(cmdtree::Flag("bye", cmdtree::FlagType::Bool).alias("b").description("Say bye instead"))
        .action([](const cmdtree::Context& c) {
            if (c.args().empty()) {
                c.help();
                return;
            }
            const auto greeting = c.boolFlag("bye") ? "Bye, " : "Hello, ";
            std::cout << greeting << join(c.args(), ", ") << "\n";
        });

    return app.run(argc, argv);
}
