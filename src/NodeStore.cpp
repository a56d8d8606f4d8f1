#include "NodeStore.hpp"
#include "Path.hpp"
#include <algorithm>
#include <utility>

namespace {

FSNode makeNode(const std::string& name, NodeKind kind, std::optional<NodeId> parent, std::time_t now) {
    FSNode n;
    n.name = name;
    n.kind = kind;
    n.parent = parent;
    n.fileProps.createdAt = now;
    n.fileProps.modifiedAt = now;
    return n;
}

}

NodeStore::NodeStore(Clock clock) : clock_(std::move(clock)) {
    root_ = allocate(makeNode("/", NodeKind::Directory, std::nullopt, now()));
}

bool NodeStore::isAlive(const NodeId& id) const noexcept {
    if (id.index >= slots_.size()) return false;
    const auto& s = slots_[id.index];
    return s.node.has_value() && s.generation == id.generation;
}

FSNode& NodeStore::at(const NodeId& id) {
    throwIf(!isAlive(id), ErrorCode::NotFound, "stale node handle");
    return *slots_[id.index].node;
}

const FSNode& NodeStore::at(const NodeId& id) const {
    throwIf(!isAlive(id), ErrorCode::NotFound, "stale node handle");
    return *slots_[id.index].node;
}

FSNode& NodeStore::fileAt(const NodeId& id) {
    auto& n = at(id);
    throwIf(!n.isFile(), ErrorCode::WrongKind, n.name);
    return n;
}

NodeId NodeStore::allocate(FSNode node) {
    NodeId id;
    if (!freeList_.empty()) {
        id.index = freeList_.back();
        auto& s = slots_[id.index];
        s.node = std::move(node);
        id.generation = s.generation;
        freeList_.pop_back();
    } else {
        slots_.push_back(Slot{1, std::move(node)});
        id.index = static_cast<std::uint32_t>(slots_.size() - 1);
        id.generation = 1;
    }
    ++live_;
    return id;
}

void NodeStore::release(const NodeId& id) {
    auto& s = slots_[id.index];
    s.node.reset();
    ++s.generation;
    freeList_.push_back(id.index);
    --live_;
}

std::time_t NodeStore::now() const {
    return clock_ ? clock_() : std::time(nullptr);
}

// modifiedAt никогда не идёт назад, даже если часы отстают
void NodeStore::touch(FSNode& n) {
    n.fileProps.modifiedAt = std::max({now(), n.fileProps.modifiedAt, n.fileProps.createdAt});
}

NodeId NodeStore::createNode(const NodeId& parent, const std::string& name, NodeKind kind) {
    auto& p = at(parent);
    throwIf(p.isFile(), ErrorCode::WrongKind, p.name);
    throwIf(!isValidName(name), ErrorCode::InvalidName, name);
    throwIf(findChild(parent, name).has_value(), ErrorCode::DuplicateName, name);

    p.children.reserve(p.children.size() + 1);
    auto id = allocate(makeNode(name, kind, parent, now()));

    // allocate() мог переразместить slots_, ссылку на родителя берём заново
    auto& pp = at(parent);
    pp.children.push_back(id);
    touch(pp);

    bus_.publish(Events::Inserted{parent, id});
    return id;
}

void NodeStore::destroySubtree(const NodeId& id, std::vector<ChangeEvent>& removed) {
    // копия: дети вырезают себя из at(id).children по ходу
    auto kids = at(id).children;
    for (const auto& child : kids) destroySubtree(child, removed);

    auto& n = at(id);
    auto parentId = *n.parent;
    auto& siblings = at(parentId).children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());

    removed.emplace_back(Events::Removed{parentId, id, n.name});
    n.parent.reset();
    n.children.clear();
    release(id);
}

void NodeStore::deleteNode(const NodeId& node) {
    const auto& n = at(node);
    throwIf(node == root_, ErrorCode::RootViolation, "/");
    auto parentId = *n.parent;

    std::size_t total = 0;
    std::vector<NodeId> stack{node};
    while (!stack.empty()) {
        auto cur = stack.back();
        stack.pop_back();
        ++total;
        const auto& kids = at(cur).children;
        stack.insert(stack.end(), kids.begin(), kids.end());
    }

    std::vector<ChangeEvent> removed;
    removed.reserve(total);
    freeList_.reserve(freeList_.size() + total);
    destroySubtree(node, removed);
    touch(at(parentId));

    bus_.publish(removed);
}

void NodeStore::renameNode(const NodeId& node, const std::string& newName) {
    auto& n = at(node);
    throwIf(node == root_, ErrorCode::RootViolation, "/");
    throwIf(!isValidName(newName), ErrorCode::InvalidName, newName);
    if (n.name == newName) return;

    auto parentId = *n.parent;
    throwIf(findChild(parentId, newName).has_value(), ErrorCode::DuplicateName, newName);

    auto oldName = std::exchange(n.name, newName);
    touch(at(parentId));

    bus_.publish(Events::Renamed{node, std::move(oldName)});
}

void NodeStore::updateContent(const NodeId& node, const std::string& text) {
    auto& f = fileAt(node);
    f.content.assignText(text);
    touch(f);
    bus_.publish(Events::ContentChanged{node});
}

void NodeStore::appendContent(const NodeId& node, const std::string& text) {
    auto& f = fileAt(node);
    f.content.append(text);
    touch(f);
    bus_.publish(Events::ContentChanged{node});
}

std::vector<NodeId> NodeStore::listChildren(const NodeId& node) const {
    return at(node).children;
}

std::size_t NodeStore::childCount(const NodeId& node) const {
    return at(node).children.size();
}

std::optional<NodeId> NodeStore::findChild(const NodeId& parent, const std::string& name) const {
    for (const auto& child : at(parent).children) {
        if (at(child).name == name) return child;
    }
    return std::nullopt;
}

std::optional<NodeId> NodeStore::parent(const NodeId& node) const {
    return at(node).parent;
}

std::optional<NodeId> NodeStore::firstChild(const NodeId& node) const {
    const auto& kids = at(node).children;
    if (kids.empty()) return std::nullopt;
    return kids.front();
}

std::optional<NodeId> NodeStore::nextSibling(const NodeId& node) const {
    const auto& n = at(node);
    if (!n.parent) return std::nullopt;
    const auto& kids = at(*n.parent).children;
    auto i = at(*n.parent).indexOf(node);
    if (i + 1 >= kids.size()) return std::nullopt;
    return kids[i + 1];
}

std::optional<NodeId> NodeStore::prevSibling(const NodeId& node) const {
    const auto& n = at(node);
    if (!n.parent) return std::nullopt;
    const auto& p = at(*n.parent);
    auto i = p.indexOf(node);
    if (i == 0 || i >= p.children.size()) return std::nullopt;
    return p.children[i - 1];
}

std::size_t NodeStore::indexInParent(const NodeId& node) const {
    const auto& n = at(node);
    if (!n.parent) return 0;
    return at(*n.parent).indexOf(node);
}

const std::string& NodeStore::name(const NodeId& node) const { return at(node).name; }
NodeKind NodeStore::kind(const NodeId& node) const { return at(node).kind; }
std::time_t NodeStore::createdAt(const NodeId& node) const { return at(node).fileProps.createdAt; }
std::time_t NodeStore::modifiedAt(const NodeId& node) const { return at(node).fileProps.modifiedAt; }
const FSNode& NodeStore::node(const NodeId& id) const { return at(id); }

std::string NodeStore::content(const NodeId& node) const {
    const auto& n = at(node);
    throwIf(!n.isFile(), ErrorCode::WrongKind, n.name);
    return n.content.asText();
}

std::optional<std::size_t> NodeStore::size(const NodeId& node) const {
    const auto& n = at(node);
    if (!n.isFile()) return std::nullopt;
    return n.content.size();
}

std::string NodeStore::fullPath(const NodeId& node) const {
    std::vector<const std::string*> parts;
    auto cur = std::optional<NodeId>(node);
    while (cur && *cur != root_) {
        const auto& n = at(*cur);
        parts.push_back(&n.name);
        cur = n.parent;
    }
    if (parts.empty()) return "/";
    std::string out;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        out += "/";
        out += **it;
    }
    return out;
}

bool NodeStore::isAncestorOf(const NodeId& ancestor, const NodeId& node) const {
    auto cur = at(node).parent;
    while (cur) {
        if (*cur == ancestor) return true;
        cur = at(*cur).parent;
    }
    return false;
}
