#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cmdtree/app.hpp"
#include "cmdtree/help.hpp"

using namespace cmdtree;

class HelpTest : public ::testing::Test {
protected:
    void SetUp() override {
        info.name = "calc";
        info.author = "someone";
        info.version = "0.3.0";
        info.helpFlags = {"help", "h"};
        info.helpCommand = "help";

        add.alias("a").flag(Flag("age", FlagType::Int).alias("g").description("Age in years"));
        add.command(Command("sub", "Subtract"));
        root.description("A calculator").flag(Flag("verbose").alias("v").description("Talk more")).command(add);
    }

    std::vector<const Command*> chainTo(const std::string& child) const {
        return {&root, root.findSubcommand(child)};
    }

    AppInfo info;
    Command root{"calc"};
    Command add{"add", "Add numbers"};
};

// Test: Flag spellings use one dash for single characters
TEST(HelpFormatTest, FlagSpelling) {
    EXPECT_EQ(help::flagSpelling("v"), "-v");
    EXPECT_EQ(help::flagSpelling("verbose"), "--verbose");
}

// Test: Flag lines show spellings, type and description
TEST(HelpFormatTest, FormatFlag) {
    EXPECT_EQ(help::formatFlag(Flag("age", FlagType::Int).alias("a").description("Age")), "--age, -a int - Age");
    EXPECT_EQ(help::formatFlag(Flag("bye").alias("b")), "--bye, -b");
    EXPECT_EQ(help::formatFlag(Flag("ratio", FlagType::Float)), "--ratio float");
}

// Test: Version line
TEST(HelpFormatTest, VersionText) {
    AppInfo info;
    EXPECT_EQ(help::versionText(info), "");
    info.name = "calc";
    info.version = "1.0";
    EXPECT_EQ(help::versionText(info), "calc version 1.0");
    info.displayName = "Calc";
    EXPECT_EQ(help::versionText(info), "Calc version 1.0");
}

// Test: Root help lists header, usage, commands and flags
TEST_F(HelpTest, RootHelp) {
    const auto text = help::render(info, {&root});
    EXPECT_EQ(text.rfind("calc 0.3.0\nsomeone\n\nUsage: calc [command] [flags] [args]\n", 0), 0u);
    EXPECT_NE(text.find("\nA calculator\n"), std::string::npos);
    EXPECT_NE(text.find("Commands:\n  help - Help about any command\n  add, a - Add numbers\n"), std::string::npos);
    EXPECT_NE(text.find("Flags:\n  --verbose, -v - Talk more\n  --help, -h - Help for calc\n"), std::string::npos);
    EXPECT_EQ(text.find("Global Flags:"), std::string::npos);
}

// Test: Subcommand help shows aliases and inherited flags
TEST_F(HelpTest, SubcommandHelp) {
    const auto text = help::render(info, chainTo("add"));
    EXPECT_EQ(text.rfind("Usage: calc add [command] [flags] [args]\n", 0), 0u);
    EXPECT_NE(text.find("Aliases:\n  add, a\n"), std::string::npos);
    EXPECT_NE(text.find("Commands:\n  sub - Subtract\n"), std::string::npos);
    EXPECT_NE(text.find("  --age, -g int - Age in years\n"), std::string::npos);
    EXPECT_NE(text.find("Global Flags:\n  --verbose, -v - Talk more\n"), std::string::npos);
    EXPECT_EQ(text.find("help - Help about any command"), std::string::npos);
}

// Test: Custom usage replaces the generated line
TEST_F(HelpTest, CustomUsage) {
    root.usage("calc [op] [numbers...]");
    const auto text = help::render(info, {&root});
    EXPECT_NE(text.find("Usage: calc [op] [numbers...]\n"), std::string::npos);
}

// Test: Theme colors section titles
TEST_F(HelpTest, ThemedOutput) {
    const auto& theme = color::defaultTheme();
    const auto text = help::render(info, {&root}, &theme);
    EXPECT_NE(text.find(theme.section + "Commands:" + theme.reset), std::string::npos);
    EXPECT_NE(text.find(theme.flag + "--verbose, -v" + theme.reset), std::string::npos);
}

// Test: App help with color never uses plain text
TEST(AppHelpTextTest, AppHelpIsPlainWhenColorOff) {
    App app("tool");
    App::Options opts;
    opts.colorMode = ColorMode::Never;
    app.options(opts).displayName("Tool").version("2.0");
    const auto text = app.helpText();
    EXPECT_EQ(text.rfind("Tool 2.0\n", 0), 0u);
    EXPECT_EQ(text.find("\x1b["), std::string::npos);
}

// Test: App help honors ColorMode::Always
TEST(AppHelpTextTest, AppHelpColoredWhenAlways) {
    App app("tool");
    App::Options opts;
    opts.colorMode = ColorMode::Always;
    app.options(opts);
    EXPECT_NE(app.helpText().find("\x1b["), std::string::npos);
}
