#include "PathResolver.hpp"
#include "Path.hpp"

NodeId PathResolver::resolve(const std::string& path) const {
    return resolve(path, store_.root());
}

NodeId PathResolver::resolve(const std::string& path, const NodeId& from) const {
    NodeId cur = isAbsolutePath(path) ? store_.root() : from;
    throwIf(!store_.isAlive(cur), ErrorCode::NotFound, path);
    auto homeNode = home();

    for (const auto& name : splitPath(path)) {
        if (name == ".") continue;
        if (name == "..") {
            if (auto p = store_.parent(cur)) cur = *p;
            continue;
        }
        if (name == "~" && homeNode) {
            cur = *homeNode;
            continue;
        }
        // у файла детей нет, поэтому /file/x даёт NotFound
        auto child = store_.findChild(cur, name);
        throwIf(!child, ErrorCode::NotFound, path);
        cur = *child;
    }
    return cur;
}

PathResolver::ParentAndLeaf PathResolver::resolveParent(const std::string& path, const NodeId& from) const {
    auto parts = splitPath(path);
    throwIf(parts.empty(), ErrorCode::InvalidName, path);
    auto leaf = parts.back();
    throwIf(!isValidName(leaf), ErrorCode::InvalidName, leaf);
    parts.pop_back();

    std::string parentPath = isAbsolutePath(path) ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        parentPath += parts[i];
        if (i + 1 < parts.size()) parentPath += "/";
    }

    auto parent = resolve(parentPath, from);
    throwIf(!store_.isDirectory(parent), ErrorCode::WrongKind, path);
    return {parent, leaf};
}

void PathResolver::setHome(const NodeId& home) {
    throwIf(!store_.isAlive(home), ErrorCode::NotFound, "~");
    throwIf(!store_.isDirectory(home), ErrorCode::WrongKind, "~");
    home_ = home;
}

// якорь, удалённый из дерева, считается сброшенным
std::optional<NodeId> PathResolver::home() const {
    if (home_ && store_.isAlive(*home_)) return home_;
    return std::nullopt;
}
