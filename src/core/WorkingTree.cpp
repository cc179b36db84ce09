#include "core/WorkingTree.hpp"

#include <sstream>

#include "core/ObjectStore.hpp"
#include "core/TreeObject.hpp"
#include "util/Expected.hpp"

namespace gitcask {

namespace {
    std::vector<std::string> splitPath(const std::string& path) {
        std::vector<std::string> parts;
        std::stringstream ss(path);
        std::string part;
        while (std::getline(ss, part, '/')) {
            if (part.empty() || part == ".") continue;
            if (part == "..") {
                throw StoreError(ErrorCode::InvalidArgs, "Path escapes the tree: " + path);
            }
            parts.push_back(part);
        }
        return parts;
    }
}

WorkingTree::WorkingTree(ObjectStore& store) : store(&store), loaded(true) {}

WorkingTree::WorkingTree(ObjectStore& store, std::string treeId)
    : store(&store), treeId(std::move(treeId)) {}

void WorkingTree::ensureLoaded() {
    if (loaded) return;
    TreeObject tree = store->getTree(treeId).valueOrThrow();
    for (auto& te : tree.entries) {
        Entry e;
        e.mode = te.isTree() ? Constants::MODE_DIR : te.mode;
        e.id = std::move(te.hashHex);
        entries.emplace(std::move(te.name), std::move(e));
    }
    loaded = true;
}

WorkingTree* WorkingTree::walk(const std::vector<std::string>& parts, size_t depth, bool create,
                               std::vector<WorkingTree*>* trail) {
    WorkingTree* node = this;
    for (size_t i = 0; i < depth; ++i) {
        if (trail) trail->push_back(node);
        node->ensureLoaded();
        auto it = node->entries.find(parts[i]);
        if (it == node->entries.end() || !it->second.isDir()) {
            if (!create) return nullptr;
            // A file in the way is replaced by the new directory
            Entry dir;
            dir.mode = Constants::MODE_DIR;
            dir.subtree = std::make_unique<WorkingTree>(*store);
            it = node->entries.insert_or_assign(parts[i], std::move(dir)).first;
        } else if (!it->second.subtree) {
            it->second.subtree = std::make_unique<WorkingTree>(*store, it->second.id);
        }
        node = it->second.subtree.get();
    }
    if (trail) trail->push_back(node);
    node->ensureLoaded();
    return node;
}

std::optional<std::string> WorkingTree::read(const std::string& path) {
    auto parts = splitPath(path);
    if (parts.empty()) return std::nullopt;
    WorkingTree* dir = walk(parts, parts.size() - 1, false);
    if (!dir) return std::nullopt;

    auto it = dir->entries.find(parts.back());
    if (it == dir->entries.end() || it->second.isDir()) return std::nullopt;
    Entry& e = it->second;
    if (!e.content) {
        e.content = store->getBlob(e.id).valueOrThrow();
    }
    return e.content;
}

void WorkingTree::write(const std::string& path, const std::string& content, uint32_t mode) {
    auto parts = splitPath(path);
    if (parts.empty()) {
        throw StoreError(ErrorCode::InvalidArgs, "Cannot write to the tree root");
    }
    std::vector<WorkingTree*> trail;
    WorkingTree* dir = walk(parts, parts.size() - 1, true, &trail);

    Entry e;
    e.mode = mode;
    e.content = content;
    dir->entries.insert_or_assign(parts.back(), std::move(e));
    for (WorkingTree* node : trail) node->modified = true;
}

bool WorkingTree::remove(const std::string& path) {
    auto parts = splitPath(path);
    if (parts.empty()) {
        throw StoreError(ErrorCode::InvalidArgs, "Cannot remove the tree root");
    }
    std::vector<WorkingTree*> trail;
    WorkingTree* dir = walk(parts, parts.size() - 1, false, &trail);
    if (!dir || dir->entries.erase(parts.back()) == 0) return false;
    for (WorkingTree* node : trail) node->modified = true;
    return true;
}

bool WorkingTree::contains(const std::string& path) {
    auto parts = splitPath(path);
    if (parts.empty()) return true;
    WorkingTree* dir = walk(parts, parts.size() - 1, false);
    return dir && dir->entries.count(parts.back()) > 0;
}

std::vector<std::string> WorkingTree::list(const std::string& dirPath) {
    auto parts = splitPath(dirPath);
    std::vector<std::string> names;
    WorkingTree* dir = walk(parts, parts.size(), false);
    if (!dir) return names;
    for (const auto& kv : dir->entries) names.push_back(kv.first);
    return names;
}

std::string WorkingTree::save(ObjectStore& target) {
    if (!modified && !treeId.empty()) return treeId;
    ensureLoaded();

    std::vector<TreeEntry> out;
    for (auto it = entries.begin(); it != entries.end();) {
        Entry& e = it->second;
        if (e.isDir() && e.subtree && (e.subtree->modified || e.subtree->treeId.empty())) {
            e.id = e.subtree->save(target);
            if (e.subtree->entries.empty()) {
                it = entries.erase(it);
                continue;
            }
        } else if (!e.isDir() && e.id.empty()) {
            e.id = target.put(ObjectType::Blob, e.content.value_or(""));
        }
        out.push_back(TreeEntry{e.mode, it->first, e.id});
        ++it;
    }

    treeId = target.put(ObjectType::Tree, serializeTree(std::move(out)));
    modified = false;
    return treeId;
}

}
