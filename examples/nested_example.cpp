#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

// calc add 1 2 3
// calc a sub 10 4 --verbose
// calc hello Alice --age 30
int main(int argc, char** argv) {
    using cmdtree::Command;
    using cmdtree::Context;
    using cmdtree::Flag;
    using cmdtree::FlagType;

    auto sum = [](const Context& c) {
        double total = 0.0;
        for (const auto& a : c.args()) {
            const auto v = Flag::parseFloat(a);
            if (!v) {
                std::cerr << "not a number: " << a << "\n";
                return;
            }
            total += *v;
        }
        if (c.boolFlag("verbose")) std::cout << "sum of " << c.args().size() << " values: ";
        std::cout << total << "\n";
    };

    Command sub("sub", "Subtract the remaining numbers from the first");
    sub.alias("s").action([](const Context& c) {
        if (c.args().empty()) return c.help();
        double total = Flag::parseFloat(c.args().front()).value_or(0.0);
        for (std::size_t i = 1; i < c.args().size(); ++i) total -= Flag::parseFloat(c.args()[i]).value_or(0.0);
        std::cout << total << "\n";
    });

    Command add("add", "Add numbers");
    add.alias("a").action(sum).command(sub);

    Command hello("hello", "Greet someone");
    hello.flag(Flag("age", FlagType::Int).alias("a, ag").description("Age of the person"))
        .flag(Flag("scale", FlagType::Float).description("Multiplier applied to the age"))
        .action([](const Context& c) {
            std::cout << "Hello, " << (c.args().empty() ? std::string("stranger") : c.args().front()) << "\n";
            const auto age = c.intFlag("age");
            if (!age) {
                std::cout << "age: " << cmdtree::describe(age.error()) << "\n";
                return;
            }
            const auto scale = c.floatFlag("scale").valueOr(1.0);
            std::cout << "age: " << static_cast<double>(age.value()) * scale << "\n";
        });

    cmdtree::App app("calc");
    app.author("cmdtree authors")
        .description("Nested command example")
        .version("1.0.0")
        .flag(Flag("verbose").alias("v").description("Explain the result"))
        .command(add)
        .command(hello);

    return app.run(argc, argv);
}
