#include "cmdtree/app.hpp"

#include <iostream>

#include "cmdtree/tokenizer.hpp"
#include "cmdtree/utils.hpp"

namespace cmdtree {

namespace {

bool declaredInTree(const Command& cmd, const std::string& key) {
    if (cmd.findFlag(key)) return true;
    for (const auto& child : cmd.commands()) {
        if (declaredInTree(child, key)) return true;
    }
    return false;
}

} // namespace

std::optional<std::string> App::validate() const {
    if (auto err = root_.validate()) return "invalid command tree: " + *err;
    return std::nullopt;
}

int App::run(int argc, char** argv) const {
    std::vector<std::string> args;
    args.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0);
    for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int App::run(const std::vector<std::string>& args) const {
    const auto err = runWithResult(args);
    if (!err) return 0;
    this->err() << "Error: " << *err;
    if (err->empty() || err->back() != '\n') this->err() << "\n";
    return 1;
}

std::optional<std::string> App::runWithResult(const std::vector<std::string>& args) const {
    if (auto err = validate()) return err;

    std::vector<std::string> rest;
    if (!args.empty()) rest.assign(args.begin() + 1, args.end());

    const auto tokens = extract(rest, switchKeys());
    const auto resolution = resolve(root_, tokens.positionals);

    if (resolution.isRoot() && !options_.helpCommand.empty() && !resolution.remaining.empty() &&
        resolution.remaining.front() == options_.helpCommand) {
        const std::vector<std::string> path(resolution.remaining.begin() + 1, resolution.remaining.end());
        out() << helpText(resolve(root_, path).chain);
        return std::nullopt;
    }

    const auto chain = resolution.chain;
    const Context ctx(resolution.remaining, tokens.flags, chain, [this, chain] { return helpText(chain); }, &out());

    if (triggered(options_.helpFlags, ctx, tokens)) {
        out() << ctx.helpText();
        return std::nullopt;
    }

    if (resolution.isRoot() && !info_.version.empty() && triggered(options_.versionFlags, ctx, tokens)) {
        out() << help::versionText(info_) << "\n";
        return std::nullopt;
    }

    const auto& cmd = resolution.command();
    if (cmd.runnable()) return cmd.invoke(ctx);
    if (root_.runnable()) return root_.invoke(ctx);
    return std::nullopt;
}

std::string App::helpText() const {
    return helpText({&root_});
}

std::string App::helpText(const std::vector<const Command*>& chain) const {
    if (chain.empty()) return helpText();
    return help::render(helpInfo(), chain, colorEnabled() ? &color::defaultTheme() : nullptr);
}

void App::printHelp() const {
    out() << helpText();
}

AppInfo App::helpInfo() const {
    AppInfo info = info_;
    info.helpFlags = options_.helpFlags;
    info.helpCommand = options_.helpCommand;
    return info;
}

bool App::colorEnabled() const {
    return color::enabled(options_.colorMode, out());
}

std::vector<std::string> App::switchKeys() const {
    std::vector<std::string> keys;
    for (const auto* list : {&options_.helpFlags, &options_.versionFlags}) {
        for (const auto& key : *list) {
            if (!declaredInTree(root_, key)) keys.push_back(key);
        }
    }
    return keys;
}

bool App::triggered(const std::vector<std::string>& keys, const Context& ctx, const Tokens& tokens) const {
    for (const auto& f : tokens.flags) {
        if (!utils::contains(keys, f.key)) continue;
        if (ctx.findFlag(f.key)) continue;
        return true;
    }
    return false;
}

std::ostream& App::out() const {
    if (out_) return *out_;
    return std::cout;
}

std::ostream& App::err() const {
    if (err_) return *err_;
    return std::cerr;
}

} // namespace cmdtree
