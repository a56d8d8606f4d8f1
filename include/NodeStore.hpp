#pragma once

#include "FSNode.hpp"
#include "ChangeBus.hpp"
#include "Errors.hpp"
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * Дерево узлов в арене.
 *  - Узлы адресуются NodeId {index, generation}; слот удалённого узла
 *    переиспользуется с новым generation.
 *  - Дети каждой директории хранятся как упорядоченный вектор дескрипторов (порядок создания).
 *  - Каждая успешная мутация публикует события в bus() строго после того,
 *    как инварианты восстановлены. Неуспешная мутация ничего не меняет
 *    и ничего не публикует.
 */
class NodeStore {
public:
    using Clock = std::function<std::time_t()>;

    explicit NodeStore(Clock clock = Clock{});
    NodeStore(const NodeStore&) = delete;
    NodeStore& operator=(const NodeStore&) = delete;

    [[nodiscard]] NodeId root() const noexcept { return root_; }
    [[nodiscard]] bool isAlive(const NodeId& id) const noexcept;

    // Мутации
    NodeId createNode(const NodeId& parent, const std::string& name, NodeKind kind);
    void deleteNode(const NodeId& node);
    void renameNode(const NodeId& node, const std::string& newName);
    void updateContent(const NodeId& node, const std::string& text);
    void appendContent(const NodeId& node, const std::string& text);

    // Чтение
    [[nodiscard("check children")]] std::vector<NodeId> listChildren(const NodeId& node) const;
    [[nodiscard]] std::size_t childCount(const NodeId& node) const;
    [[nodiscard]] std::optional<NodeId> findChild(const NodeId& parent, const std::string& name) const;
    [[nodiscard]] std::optional<NodeId> parent(const NodeId& node) const;
    [[nodiscard]] std::optional<NodeId> firstChild(const NodeId& node) const;
    [[nodiscard]] std::optional<NodeId> nextSibling(const NodeId& node) const;
    [[nodiscard]] std::optional<NodeId> prevSibling(const NodeId& node) const;
    [[nodiscard]] std::size_t indexInParent(const NodeId& node) const;

    [[nodiscard]] const std::string& name(const NodeId& node) const;
    [[nodiscard]] NodeKind kind(const NodeId& node) const;
    [[nodiscard]] bool isDirectory(const NodeId& node) const { return kind(node) == NodeKind::Directory; }
    [[nodiscard("check file content")]] std::string content(const NodeId& node) const;
    [[nodiscard]] std::optional<std::size_t> size(const NodeId& node) const;
    [[nodiscard]] std::time_t createdAt(const NodeId& node) const;
    [[nodiscard]] std::time_t modifiedAt(const NodeId& node) const;
    [[nodiscard]] const FSNode& node(const NodeId& id) const;

    [[nodiscard]] std::string fullPath(const NodeId& node) const;
    [[nodiscard]] bool isAncestorOf(const NodeId& ancestor, const NodeId& node) const;
    [[nodiscard]] std::size_t liveCount() const noexcept { return live_; }

    ChangeNotificationBus& bus() noexcept { return bus_; }
    const ChangeNotificationBus& bus() const noexcept { return bus_; }

private:
    struct Slot {
        std::uint32_t generation{0};
        std::optional<FSNode> node;
    };

    std::vector<Slot> slots_;
    std::vector<std::uint32_t> freeList_;
    std::size_t live_{0};
    NodeId root_;
    Clock clock_;
    ChangeNotificationBus bus_;

    FSNode& at(const NodeId& id);
    const FSNode& at(const NodeId& id) const;
    FSNode& fileAt(const NodeId& id);

    NodeId allocate(FSNode node);
    void release(const NodeId& id);
    void destroySubtree(const NodeId& id, std::vector<ChangeEvent>& removed);
    void touch(FSNode& n);
    std::time_t now() const;
};
