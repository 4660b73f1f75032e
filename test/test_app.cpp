#include <gtest/gtest.h>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "cmdtree/app.hpp"

using namespace cmdtree;

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        Command sub("sub", "Subtract");
        sub.action([this](const Context& c) {
            ran = "sub";
            args = c.args();
        });

        Command add("add", "Add numbers");
        add.alias("a")
            .flag(Flag("age", FlagType::Int).alias("g"))
            .action([this](const Context& c) {
                ran = "add";
                args = c.args();
                age = c.intFlag("age").valueOr(-1);
                verbose = c.boolFlag("verbose");
            })
            .command(sub);

        Command noop("noop", "Has no action");

        app.version("1.2.3")
            .description("Test app")
            .flag(Flag("verbose").alias("v"))
            .command(add)
            .command(noop)
            .setOut(out)
            .setErr(err);
    }

    void withRootAction() {
        app.action([this](const Context& c) {
            ran = "root";
            args = c.args();
            verbose = c.boolFlag("verbose");
        });
    }

    App app{"calc"};
    std::ostringstream out;
    std::ostringstream err;
    std::string ran;
    std::vector<std::string> args;
    std::int64_t age{0};
    bool verbose{false};
};

// Test: argv[0] is dropped and the nested command runs with the rest
TEST_F(AppTest, DispatchesNestedCommand) {
    EXPECT_EQ(app.run({"calc", "add", "sub", "1", "2"}), 0);
    EXPECT_EQ(ran, "sub");
    EXPECT_EQ(args, (std::vector<std::string>{"1", "2"}));
}

// Test: Flags reach the matched command, including root flags
TEST_F(AppTest, FlagsReachAction) {
    EXPECT_EQ(app.run({"calc", "a", "--age", "30", "x", "-v"}), 0);
    EXPECT_EQ(ran, "add");
    EXPECT_EQ(age, 30);
    EXPECT_TRUE(verbose);
    EXPECT_EQ(args, (std::vector<std::string>{"x"}));
}

// Test: Flags may precede the command name
TEST_F(AppTest, FlagsBeforeCommand) {
    EXPECT_EQ(app.run({"calc", "--age=5", "add", "y"}), 0);
    EXPECT_EQ(ran, "add");
    EXPECT_EQ(age, 5);
    EXPECT_EQ(args, (std::vector<std::string>{"y"}));
}

// Test: No match and no root action is a silent no-op
TEST_F(AppTest, NoMatchNoRootActionIsNoop) {
    EXPECT_EQ(app.run({"calc", "mul", "1", "2"}), 0);
    EXPECT_TRUE(ran.empty());
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(err.str().empty());
}

// Test: No match falls back to the root action with every positional
TEST_F(AppTest, NoMatchRunsRootAction) {
    withRootAction();
    EXPECT_EQ(app.run({"calc", "mul", "1", "2"}), 0);
    EXPECT_EQ(ran, "root");
    EXPECT_EQ(args, (std::vector<std::string>{"mul", "1", "2"}));
}

// Test: A matched command without an action falls back to the root action
TEST_F(AppTest, ActionlessCommandFallsBackToRoot) {
    withRootAction();
    EXPECT_EQ(app.run({"calc", "noop", "z"}), 0);
    EXPECT_EQ(ran, "root");
    EXPECT_EQ(args, (std::vector<std::string>{"z"}));
}

// Test: Empty argument vector and argv[0] only both reach the root
TEST_F(AppTest, EmptyArgs) {
    withRootAction();
    EXPECT_EQ(app.run(std::vector<std::string>{}), 0);
    EXPECT_EQ(ran, "root");
    ran.clear();
    EXPECT_EQ(app.run({"calc"}), 0);
    EXPECT_EQ(ran, "root");
    EXPECT_TRUE(args.empty());
}

// Test: The tree can be dispatched repeatedly with the same results
TEST_F(AppTest, RepeatedRunsAreIndependent) {
    EXPECT_EQ(app.run({"calc", "add", "--age", "1"}), 0);
    EXPECT_EQ(age, 1);
    EXPECT_EQ(app.run({"calc", "add"}), 0);
    EXPECT_EQ(age, -1);
    EXPECT_EQ(app.run({"calc", "add", "--age", "1"}), 0);
    EXPECT_EQ(age, 1);
}

// Test: run(argc, argv) matches the vector overload
TEST_F(AppTest, RunWithArgv) {
    std::vector<std::string> storage{"calc", "add", "sub", "9"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());
    EXPECT_EQ(app.run(static_cast<int>(argv.size()), argv.data()), 0);
    EXPECT_EQ(ran, "sub");
    EXPECT_EQ(args, (std::vector<std::string>{"9"}));
}

// Test: --help prints help for the resolved command instead of running it
TEST_F(AppTest, HelpFlag) {
    EXPECT_EQ(app.run({"calc", "add", "--help"}), 0);
    EXPECT_TRUE(ran.empty());
    EXPECT_NE(out.str().find("Usage: calc add"), std::string::npos);
    EXPECT_NE(out.str().find("Add numbers"), std::string::npos);
}

// Test: -h is a help trigger too
TEST_F(AppTest, ShortHelpFlag) {
    EXPECT_EQ(app.run({"calc", "-h"}), 0);
    EXPECT_TRUE(ran.empty());
    EXPECT_NE(out.str().find("Usage: calc"), std::string::npos);
}

// Test: The help command describes the path after it
TEST_F(AppTest, HelpCommand) {
    EXPECT_EQ(app.run({"calc", "help", "add", "sub"}), 0);
    EXPECT_TRUE(ran.empty());
    EXPECT_NE(out.str().find("Usage: calc add sub"), std::string::npos);
}

// Test: A help flag ahead of the command path does not swallow it
TEST_F(AppTest, HelpFlagBeforeCommandPath) {
    EXPECT_EQ(app.run({"calc", "--help", "a", "sub"}), 0);
    EXPECT_TRUE(ran.empty());
    EXPECT_NE(out.str().find("Usage: calc add sub"), std::string::npos);
}

// Test: The version flag takes no value either
TEST_F(AppTest, VersionFlagTakesNoValue) {
    EXPECT_EQ(app.run({"calc", "--version", "extra"}), 0);
    EXPECT_EQ(out.str(), "calc version 1.2.3\n");
}

// Test: printHelp writes the root help to the output stream
TEST_F(AppTest, PrintHelp) {
    app.printHelp();
    EXPECT_EQ(out.str(), app.helpText());
    EXPECT_EQ(out.str().rfind("calc 1.2.3\n", 0), 0u);
    EXPECT_TRUE(ran.empty());
}

// Test: A declared value flag named "help" still reads the next word
TEST(AppHelpOverrideTest, DeclaredHelpValueFlag) {
    std::ostringstream out;
    std::string topic;
    App app("doc");
    app.flag(Flag("help", FlagType::String))
        .action([&topic](const Context& c) { topic = c.stringFlag("help").valueOr(""); })
        .setOut(out);
    EXPECT_EQ(app.run({"doc", "--help", "install"}), 0);
    EXPECT_EQ(topic, "install");
    EXPECT_TRUE(out.str().empty());
}

// Test: A declared flag named like a help trigger is an ordinary flag
TEST(AppHelpOverrideTest, DeclaredHelpFlagIsNotTrigger) {
    std::ostringstream out;
    bool human = false;
    App app("ls");
    app.flag(Flag("h").description("human readable"))
        .action([&human](const Context& c) { human = c.boolFlag("h"); })
        .setOut(out);
    EXPECT_EQ(app.run({"ls", "-h"}), 0);
    EXPECT_TRUE(human);
    EXPECT_TRUE(out.str().empty());
}

// Test: Help triggers are configurable
TEST(AppHelpOverrideTest, CustomHelpOptions) {
    std::ostringstream out;
    bool ran = false;
    App app("tool");
    App::Options opts;
    opts.helpFlags = {"usage"};
    opts.helpCommand.clear();
    app.options(opts).action([&ran](const Context&) { ran = true; }).setOut(out);

    EXPECT_EQ(app.run({"tool", "--help"}), 0);
    EXPECT_TRUE(ran);
    ran = false;
    EXPECT_EQ(app.run({"tool", "help"}), 0);
    EXPECT_TRUE(ran);
    ran = false;
    EXPECT_EQ(app.run({"tool", "--usage"}), 0);
    EXPECT_FALSE(ran);
    EXPECT_NE(out.str().find("Usage: tool"), std::string::npos);
}

// Test: --version prints the version at the root only
TEST_F(AppTest, VersionFlag) {
    EXPECT_EQ(app.run({"calc", "--version"}), 0);
    EXPECT_EQ(out.str(), "calc version 1.2.3\n");
    out.str("");

    EXPECT_EQ(app.run({"calc", "add", "--version"}), 0);
    EXPECT_EQ(ran, "add");
    EXPECT_TRUE(out.str().empty());
}

// Test: ActionE failures surface through run and runWithResult
TEST(AppActionErrorTest, ActionErrorPropagates) {
    std::ostringstream out;
    std::ostringstream err;
    App app("cli");
    app.flag(Flag("error").alias("e"))
        .actionE([](const Context& c) -> std::optional<std::string> {
            if (c.boolFlag("error")) return std::string("ERROR...");
            return std::nullopt;
        })
        .setOut(out)
        .setErr(err);

    EXPECT_FALSE(app.runWithResult({"cli"}).has_value());
    const auto res = app.runWithResult({"cli", "-e"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, "ERROR...");
    EXPECT_TRUE(err.str().empty());

    EXPECT_EQ(app.run({"cli", "--error"}), 1);
    EXPECT_EQ(err.str(), "Error: ERROR...\n");
}

// Test: An invalid tree is rejected before anything runs
TEST(AppValidateTest, InvalidTreeRejected) {
    std::ostringstream err;
    bool ran = false;
    App app("dup");
    app.command(Command("x").action([&ran](const Context&) { ran = true; }))
        .command(Command("x"))
        .setErr(err);

    ASSERT_TRUE(app.validate().has_value());
    EXPECT_EQ(app.run({"dup", "x"}), 1);
    EXPECT_FALSE(ran);
    EXPECT_EQ(err.str().rfind("Error: invalid command tree:", 0), 0u);
}

// Test: Context::help inside an action prints the matched command's help
TEST(AppContextHelpTest, ActionCanPrintHelp) {
    std::ostringstream out;
    App app("greet");
    Command hello("hello", "Greets people");
    hello.action([](const Context& c) {
        if (c.args().empty()) c.help();
    });
    app.command(hello).setOut(out);

    EXPECT_EQ(app.run({"greet", "hello"}), 0);
    EXPECT_NE(out.str().find("Usage: greet hello"), std::string::npos);
    EXPECT_NE(out.str().find("Greets people"), std::string::npos);
}
