#include "Shell.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "TestUtils.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

struct Session {
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    Shell shell;

    explicit Session(const ShellConfig& cfg = ShellConfig{}, const std::string& input = "")
        : in(input), shell(cfg, in, out, err) {}

    std::string run(const std::string& line) {
        out.str("");
        err.str("");
        shell.execute(line);
        return out.str();
    }
};

static void test_home_is_created_and_used() {
    Session s;
    assert(s.shell.pwd() == "/");
    assert(s.shell.resolver().home().has_value());
    s.run("cd");
    assert(s.shell.pwd() == "/home");
    s.run("mkdir docs");
    s.run("cd /");
    s.run("cd ~/docs");
    assert(s.shell.pwd() == "/home/docs");
}

static void test_no_home_config() {
    ShellConfig cfg;
    cfg.createHome = false;
    Session s(cfg);
    assert(!s.shell.resolver().home());
    assert(s.run("cd").find("usage") != std::string::npos);
    s.run("cd ~");
    assert(s.err.str().find("~") != std::string::npos);
    assert(s.shell.pwd() == "/");
}

static void test_create_list_and_navigate() {
    Session s;
    s.run("mkdir /docs");
    s.run("touch /docs/a.txt");
    s.run("mkdir /docs/sub");
    s.run("cd /docs");
    assert(s.shell.pwd() == "/docs");

    auto out = s.run("ls");
    assert(out.find("a.txt") != std::string::npos);
    assert(out.find("sub/") != std::string::npos);
    assert(out.find("a.txt") < out.find("sub/"));

    s.run("cd sub");
    s.run("back");
    assert(s.shell.pwd() == "/docs");
    s.run("forward");
    assert(s.shell.pwd() == "/docs/sub");
    s.run("up");
    assert(s.shell.pwd() == "/docs");

    out = s.run("tree");
    assert(out.find("docs/") != std::string::npos);
    assert(out.find("home/") != std::string::npos);
}

static void test_write_cat_stat() {
    Session s;
    s.run("touch note.txt");
    s.run("write note.txt hello world");
    assert(s.run("cat note.txt") == "hello world\n");
    s.run("write note.txt again --append");
    assert(s.run("cat note.txt") == "hello worldagain\n");

    auto out = s.run("stat note.txt");
    assert(out.find("/note.txt") != std::string::npos);
    assert(out.find("16.00 B") != std::string::npos);

    s.run("cat /home");
    assert(s.err.str().find("Ошибка") != std::string::npos);
}

static void test_errors_are_reported_not_thrown() {
    Session s;
    s.run("mkdir /a");
    s.run("mkdir /a");
    assert(s.err.str().find(g_errorTable.at(ErrorCode::DuplicateName)) != std::string::npos);
    s.run("mkdir /x/y/z");
    assert(s.err.str().find("/x/y") != std::string::npos);
    s.run("rm /");
    assert(s.err.str().find(g_errorTable.at(ErrorCode::RootViolation)) != std::string::npos);
    assert(s.run("frobnicate").find("unknown command") != std::string::npos);
}

static void test_rm_confirmation() {
    Session s(ShellConfig{}, "n\ny\n");
    s.run("mkdir /d");
    s.run("touch /d/f");
    s.run("cd /d");

    s.run("rm /d");
    assert(s.out.str().find("отменено") != std::string::npos);
    assert(s.shell.pwd() == "/d");

    s.run("rm /d");
    assert(s.shell.pwd() == "/");
    s.run("cd /d");
    assert(!s.err.str().empty());

    s.run("mkdir /e");
    s.run("touch /e/f");
    s.run("rm -r /e");
    s.run("ls /");
    assert(s.out.str().find(" e/") == std::string::npos);
}

static void test_rename_via_shell() {
    Session s;
    s.run("touch /a.txt");
    s.run("rename /a.txt b.txt");
    assert(s.run("ls /").find("b.txt") != std::string::npos);
    assert(s.run("exit").empty());
    assert(!s.shell.execute("quit"));
}

static void test_event_echo() {
    ShellConfig cfg;
    cfg.echoEvents = true;
    Session s(cfg);
    assert(s.run("mkdir /d") == "+ /d\n");
    assert(s.run("touch /d/f") == "+ /d/f\n");
    assert(s.run("write /d/f abc") == "* /d/f (3.00 B)\n");
    assert(s.run("rename /d/f g") == "~ f -> /d/g\n");
    assert(s.run("rm -r /d") == "- g\n- d\n");
}

static void test_parse_args() {
    const char* a1[] = {"treefs"};
    auto c1 = parseArgs(1, a1);
    assert(c1.createHome && c1.homePath == "/home" && !c1.echoEvents);

    const char* a2[] = {"treefs", "--home", "/users", "--events"};
    auto c2 = parseArgs(4, a2);
    assert(c2.homePath == "/users" && c2.echoEvents);

    const char* a3[] = {"treefs", "--no-home"};
    assert(!parseArgs(2, a3).createHome);

    const char* bad1[] = {"treefs", "--home"};
    const char* bad2[] = {"treefs", "--colour"};
    const char* bad3[] = {"treefs", "--home", "relative"};
    const char** badCases[] = {bad1, bad2};
    for (auto argv : badCases) {
        bool threw = false;
        try { (void)parseArgs(2, argv); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }
    bool threw = false;
    try { (void)parseArgs(3, bad3); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
}

int main() {
    test_home_is_created_and_used();
    test_no_home_config();
    test_create_list_and_navigate();
    test_write_cat_stat();
    test_errors_are_reported_not_thrown();
    test_rm_confirmation();
    test_rename_via_shell();
    test_event_echo();
    test_parse_args();
    std::cout << "[OK] test_shell\n";
}
