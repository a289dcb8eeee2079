#pragma once
#include <unordered_map>
#include <string>
#include <filesystem>
#include <memory>

namespace code_intelligence {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,
    INCLUDE = 1 << 1  // overrides IGNORE
};

// Path-segment trie for project-relative ignore / include rules.
class PrefixTrie {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
        bool include_below = false; // some descendant carries INCLUDE
    };

    std::unique_ptr<Node> root;

public:
    PrefixTrie() : root(std::make_unique<Node>()) {}

    void insert(const std::string& path, PathFlag flag) {
        Node* current = root.get();
        std::filesystem::path p = std::filesystem::path(path).lexically_normal();

        for (const auto& part : p) {
            std::string segment = part.string();
            if (segment == "." || segment.empty() || segment == "/") continue;
            if (flag == PathFlag::INCLUDE) current->include_below = true;

            auto& child = current->children[segment];
            if (!child) child = std::make_unique<Node>();
            current = child.get();
        }
        current->flags |= flag;
    }

    // Most specific rule on the path; INCLUDE wins over IGNORE on the same node.
    uint8_t check(const std::filesystem::path& path) const {
        const Node* current = root.get();
        uint8_t accumulated_flags = PathFlag::NONE;

        for (const auto& part : path) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;

            auto it = current->children.find(segment);
            if (it == current->children.end()) break;
            current = it->second.get();

            if (current->flags != PathFlag::NONE) {
                accumulated_flags = (current->flags & PathFlag::INCLUDE) ? PathFlag::INCLUDE : current->flags;
            }
        }
        return accumulated_flags;
    }

    // True when an INCLUDE rule sits strictly below `path`; an ignored
    // directory on that route must still be walked.
    bool has_include_below(const std::filesystem::path& path) const {
        const Node* current = root.get();
        for (const auto& part : path) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;
            auto it = current->children.find(segment);
            if (it == current->children.end()) return false;
            current = it->second.get();
        }
        return current->include_below;
    }

    void clear() {
        root = std::make_unique<Node>();
    }
};

}
