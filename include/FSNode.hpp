#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "FileContent.hpp"

enum class NodeKind { Directory, File };

// Стабильный дескриптор узла в арене NodeStore.
// generation растёт при уничтожении слота, поэтому старый дескриптор
// никогда не совпадёт с узлом, занявшим тот же слот позже.
// Живые узлы имеют generation >= 1, NodeId{} не указывает ни на что.
struct NodeId {
    std::uint32_t index{0};
    std::uint32_t generation{0};

    friend bool operator==(const NodeId& a, const NodeId& b) noexcept {
        return a.index == b.index && a.generation == b.generation;
    }
    friend bool operator!=(const NodeId& a, const NodeId& b) noexcept { return !(a == b); }
};

struct FileProperties {
    std::time_t createdAt{0};
    std::time_t modifiedAt{0};
};

struct FSNode {
    std::string name;
    NodeKind kind{NodeKind::Directory};
    std::optional<NodeId> parent;
    std::vector<NodeId> children; // порядок создания, голова в children.front()

    FileContent content;
    FileProperties fileProps;

    bool isFile() const noexcept { return kind == NodeKind::File; }

    std::size_t indexOf(const NodeId& child) const noexcept {
        for (std::size_t i = 0; i < children.size(); ++i)
            if (children[i] == child) return i;
        return children.size();
    }
};
