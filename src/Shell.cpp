#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Format.hpp"
#include "Shell.hpp"

// -----------------------------
// Утилиты парсинга
// -----------------------------
static std::vector<std::string> splitTokens(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static std::string joinFrom(const std::vector<std::string>& v, std::size_t start) {
    std::string res;
    for (std::size_t i = start; i < v.size(); ++i) {
        if (!res.empty()) res.push_back(' ');
        res += v[i];
    }
    return res;
}

static const std::size_t kPreviewChars = 100;

Shell::Shell(const ShellConfig& cfg, std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err), resolver_(store_), nav_(store_) {
    if (cfg.createHome) {
        auto [parent, leaf] = resolver_.resolveParent(cfg.homePath, store_.root());
        resolver_.setHome(store_.createNode(parent, leaf, NodeKind::Directory));
    }
    if (cfg.echoEvents) {
        echoSub_ = store_.bus().subscribe([this](const ChangeEvent& ev){ echoEvent(ev); });
    }
}

std::string Shell::pwd() const {
    return store_.fullPath(nav_.current());
}

NodeId Shell::resolvePath(const std::string& path) const {
    return resolver_.resolve(path, nav_.current());
}

// -----------------------------
// Справка
// -----------------------------
void Shell::printHelp() {
    out_
        << "Доступные команды:\n"
        << "  help                                  - показать эту справку\n"
        << "  pwd                                   - показать текущую директорию\n"
        << "  ls [path]                             - список содержимого\n"
        << "  tree                                  - вывести дерево\n"
        << "  cd [path]                             - перейти в директорию (без аргумента: в ~)\n"
        << "  back | forward | up                   - навигация по истории\n"
        << "  mkdir <path>                          - создать директорию\n"
        << "  touch <path>                          - создать пустой файл\n"
        << "  rm [-r] <path>                        - удалить файл/директорию (рекурсивно для директорий)\n"
        << "  rename <path> <newName>               - переименовать файл/директорию\n"
        << "  write <file> <text> [--append]        - записать текст в файл (добавить при --append)\n"
        << "  cat <file>                            - вывести содержимое файла\n"
        << "  stat <path>                           - свойства узла\n"
        << "  exit | quit                           - выход\n";
}

void Shell::ls(const std::string& path) {
    auto dir = path.empty() ? nav_.current() : resolvePath(path);
    throwIf(!store_.isDirectory(dir), ErrorCode::WrongKind, path);
    for (const auto& child : store_.listChildren(dir)) {
        const auto& name = store_.name(child);
        if (store_.isDirectory(child)) out_ << "  📁 " << name << "/\n";
        else out_ << "  📄 " << name << "  " << formatSize(*store_.size(child)) << "\n";
    }
}

void Shell::tree() { printTreeRec(store_.root(), 0); }

void Shell::printTreeRec(const NodeId& n, int depth) {
    for (int i=0;i<depth;++i) out_ << "  ";
    bool dir = store_.isDirectory(n);
    out_ << (dir? "📁 " : "📄 ") << store_.name(n) << (dir && n != store_.root() ? "/" : "") << "\n";
    if (dir) {
        for (const auto& child : store_.listChildren(n)) printTreeRec(child, depth+1);
    }
}

void Shell::cd(const std::string& path) {
    nav_.navigateTo(resolvePath(path));
}

void Shell::create(const std::string& path, NodeKind kind) {
    auto [parent, leaf] = resolver_.resolveParent(path, nav_.current());
    (void)store_.createNode(parent, leaf, kind);
}

bool Shell::confirm(const std::string& question) {
    out_ << question << " [y/N] ";
    std::string answer;
    if (!std::getline(in_, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

void Shell::rm(const std::string& path, bool recursive) {
    auto node = resolvePath(path);
    throwIf(node == store_.root(), ErrorCode::RootViolation, "/");
    if (!recursive && store_.isDirectory(node) && store_.childCount(node) > 0) {
        if (!confirm("Директория не пуста, удалить вместе с содержимым?")) {
            out_ << "отменено\n";
            return;
        }
    }
    store_.deleteNode(node);
}

void Shell::write(const std::vector<std::string>& args) {
    const std::string& path = args[0];

    bool append = false;
    std::vector<std::string> textParts;
    textParts.reserve(args.size() - 1);

    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--append" && i == args.size() - 1) {
            append = true;
        } else {
            textParts.push_back(args[i]);
        }
    }

    auto file = resolvePath(path);
    std::string text = joinFrom(textParts, 0);
    if (append) store_.appendContent(file, text);
    else        store_.updateContent(file, text);
}

void Shell::cat(const std::string& path) {
    auto text = store_.content(resolvePath(path));
    out_ << text;
    if (!text.empty() && text.back() != '\n') out_ << "\n";
}

void Shell::stat(const std::string& path) {
    auto n = resolvePath(path);
    bool dir = store_.isDirectory(n);
    out_ << "Имя:       " << store_.name(n) << "\n"
         << "Тип:       " << (dir ? "директория" : "файл") << "\n"
         << "Путь:      " << store_.fullPath(n) << "\n"
         << "Создан:    " << formatTime(store_.createdAt(n)) << "\n"
         << "Изменён:   " << formatTime(store_.modifiedAt(n)) << "\n";
    if (dir) {
        out_ << "Элементов: " << store_.childCount(n) << "\n";
    } else {
        out_ << "Размер:    " << formatSize(*store_.size(n)) << "\n"
             << "Превью:    " << store_.node(n).content.preview(kPreviewChars) << "\n";
    }
}

void Shell::echoEvent(const ChangeEvent& ev) {
    if (const auto* ins = std::get_if<Events::Inserted>(&ev)) {
        out_ << "+ " << store_.fullPath(ins->node) << "\n";
    } else if (const auto* rem = std::get_if<Events::Removed>(&ev)) {
        out_ << "- " << rem->name << "\n";
    } else if (const auto* ren = std::get_if<Events::Renamed>(&ev)) {
        out_ << "~ " << ren->oldName << " -> " << store_.fullPath(ren->node) << "\n";
    } else if (const auto* chg = std::get_if<Events::ContentChanged>(&ev)) {
        out_ << "* " << store_.fullPath(chg->node) << " (" << formatSize(*store_.size(chg->node)) << ")\n";
    }
}

bool Shell::execute(const std::string& line) {
    auto tokens = splitTokens(line);
    if (tokens.empty()) return true;

    const std::string& cmd = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    try {
        if (cmd == "help") {
            printHelp();
        }
        else if (cmd == "exit" || cmd == "quit") {
            return false;
        }
        else if (cmd == "pwd") {
            out_ << pwd() << "\n";
        }
        else if (cmd == "ls") {
            if (args.size() > 1) { out_ << "usage: ls [path]\n"; return true; }
            ls(args.empty() ? "" : args[0]);
        }
        else if (cmd == "tree") {
            tree();
        }
        else if (cmd == "cd") {
            if (args.size() > 1) { out_ << "usage: cd [path]\n"; return true; }
            if (args.empty() && !resolver_.home()) { out_ << "usage: cd <path>\n"; return true; }
            cd(args.empty() ? "~" : args[0]);
        }
        else if (cmd == "back") {
            nav_.back();
        }
        else if (cmd == "forward") {
            nav_.forward();
        }
        else if (cmd == "up") {
            nav_.up();
        }
        else if (cmd == "mkdir") {
            if (args.size() != 1) { out_ << "usage: mkdir <path>\n"; return true; }
            create(args[0], NodeKind::Directory);
        }
        else if (cmd == "touch") {
            if (args.size() != 1) { out_ << "usage: touch <path>\n"; return true; }
            create(args[0], NodeKind::File);
        }
        else if (cmd == "rm") {
            bool recursive = !args.empty() && args[0] == "-r";
            if (args.size() != (recursive ? 2u : 1u)) { out_ << "usage: rm [-r] <path>\n"; return true; }
            rm(args.back(), recursive);
        }
        else if (cmd == "rename") {
            if (args.size() != 2) { out_ << "usage: rename <path> <newName>\n"; return true; }
            store_.renameNode(resolvePath(args[0]), args[1]);
        }
        else if (cmd == "write") {
            if (args.size() < 2) { out_ << "usage: write <file> <text> [--append]\n"; return true; }
            write(args);
        }
        else if (cmd == "cat") {
            if (args.size() != 1) { out_ << "usage: cat <file>\n"; return true; }
            cat(args[0]);
        }
        else if (cmd == "stat") {
            if (args.size() != 1) { out_ << "usage: stat <path>\n"; return true; }
            stat(args[0]);
        }
        else {
            out_ << "unknown command: " << cmd << "\n";
        }
    } catch (const VfsException& ex) {
        handleException(ex, err_);
    } catch (const std::exception& ex) {
        err_ << "fatal: " << ex.what() << "\n";
    }
    return true;
}

void Shell::run() {
    printHelp();
    std::string line;
    while (true) {
        out_ << pwd() << " $ ";
        if (!std::getline(in_, line)) break;
        if (!execute(line)) break;
    }
}
