#pragma once

#include "NodeStore.hpp"
#include <optional>
#include <string>

// Разбор путей вида /a/b, a/b, .., ., ~ в дескрипторы узлов.
// Без якоря home сегмент "~" ищется как обычное имя.
class PathResolver {
public:
    struct ParentAndLeaf {
        NodeId parent;
        std::string leaf;
    };

    explicit PathResolver(const NodeStore& store) : store_(store) {}

    [[nodiscard("check node")]] NodeId resolve(const std::string& path) const;
    [[nodiscard("check node")]] NodeId resolve(const std::string& path, const NodeId& from) const;
    [[nodiscard("check parent")]] ParentAndLeaf resolveParent(const std::string& path, const NodeId& from) const;

    void setHome(const NodeId& home);
    void clearHome() noexcept { home_.reset(); }
    [[nodiscard]] std::optional<NodeId> home() const;

private:
    const NodeStore& store_;
    std::optional<NodeId> home_;
};
