#pragma once

#include "Config.hpp"
#include "NodeStore.hpp"
#include "PathResolver.hpp"
#include "NavigationController.hpp"
#include <iostream>
#include <string>
#include <vector>

// Консольный слой представления над NodeStore.
class Shell {
public:
    explicit Shell(const ShellConfig& cfg = ShellConfig{},
                   std::istream& in = std::cin,
                   std::ostream& out = std::cout,
                   std::ostream& err = std::cerr);

    void run();
    // false, если пришла команда выхода
    bool execute(const std::string& line);

    [[nodiscard("use result")]] std::string pwd() const;

    NodeStore& store() noexcept { return store_; }
    const PathResolver& resolver() const noexcept { return resolver_; }
    const NavigationController& nav() const noexcept { return nav_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    NodeStore store_;
    PathResolver resolver_;
    NavigationController nav_;
    ChangeNotificationBus::Subscription echoSub_;

    NodeId resolvePath(const std::string& path) const;

    void printHelp();
    void ls(const std::string& path);
    void tree();
    void printTreeRec(const NodeId& n, int depth);
    void cd(const std::string& path);
    void create(const std::string& path, NodeKind kind);
    void rm(const std::string& path, bool recursive);
    void write(const std::vector<std::string>& args);
    void cat(const std::string& path);
    void stat(const std::string& path);
    void echoEvent(const ChangeEvent& ev);
    bool confirm(const std::string& question);
};
