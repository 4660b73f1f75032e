#include <iostream>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    cmdtree::App app("paint");

    cmdtree::App::Options opts;
    opts.helpFlags = {"help"};
    opts.helpCommand.clear();
    app.options(opts)
        .displayName(cmdtree::color::yellow("paint"))
        .description("Prints its arguments in color")
        .flag(cmdtree::Flag("color", cmdtree::FlagType::String).alias("c").description("auto, always or never"))
        .action([](const cmdtree::Context& c) {
            const auto mode = cmdtree::color::parseMode(c.stringFlag("color").valueOr("auto"))
                                  .value_or(cmdtree::ColorMode::Auto);
            const bool on = cmdtree::color::enabled(mode, std::cout);
            for (const auto& a : c.args()) {
                std::cout << (on ? cmdtree::color::green(a) : a) << "\n";
            }
        });

    return app.run(argc, argv);
}
