#include "NodeStore.hpp"
#include "PathResolver.hpp"
#include "Errors.hpp"
#include "TestUtils.hpp"

#include <cassert>
#include <iostream>

static void test_remove_file_twice() {
    NodeStore s;
    auto a = s.createNode(s.root(), "a", NodeKind::Directory);
    auto f = s.createNode(a, "f", NodeKind::File);
    s.deleteNode(f);
    assert(!s.isAlive(f));
    assert(s.childCount(a) == 0);
    expectThrows(ErrorCode::NotFound, [&]{ s.deleteNode(f); });
}

static void test_recursive_directory_removal() {
    NodeStore s;
    PathResolver r(s);
    auto a = s.createNode(s.root(), "a", NodeKind::Directory);
    auto b = s.createNode(a, "b", NodeKind::Directory);
    auto c = s.createNode(b, "c.txt", NodeKind::File);
    auto d = s.createNode(b, "d.txt", NodeKind::File);
    auto deep = s.createNode(b, "deep", NodeKind::Directory);
    auto e = s.createNode(deep, "e", NodeKind::File);

    s.deleteNode(b);

    for (auto id : {b, c, d, deep, e}) assert(!s.isAlive(id));
    assert(s.isAlive(a));
    assert(s.childCount(a) == 0);
    assert(s.liveCount() == 2);
    expectThrows(ErrorCode::NotFound, [&]{ (void)r.resolve("/a/b"); });
    expectThrows(ErrorCode::NotFound, [&]{ (void)r.resolve("/a/b/c.txt"); });
}

static void test_splice_keeps_sibling_order() {
    NodeStore s;
    auto x = s.createNode(s.root(), "x", NodeKind::File);
    auto y = s.createNode(s.root(), "y", NodeKind::File);
    auto z = s.createNode(s.root(), "z", NodeKind::File);

    s.deleteNode(y);
    assert(s.nextSibling(x) == z);
    assert(s.prevSibling(z) == x);

    s.deleteNode(x); // голова
    assert(s.firstChild(s.root()) == z);
    assert(!s.prevSibling(z));

    s.deleteNode(z);
    assert(!s.firstChild(s.root()));
}

static void test_remove_root_is_forbidden() {
    NodeStore s;
    s.createNode(s.root(), "keep", NodeKind::File);
    expectThrows(ErrorCode::RootViolation, [&]{ s.deleteNode(s.root()); });
    assert(s.isAlive(s.root()));
    assert(s.childCount(s.root()) == 1);
}

static void test_stale_handle_never_aliases_new_node() {
    NodeStore s;
    auto old = s.createNode(s.root(), "old", NodeKind::File);
    s.deleteNode(old);
    auto fresh = s.createNode(s.root(), "fresh", NodeKind::File);

    assert(fresh.index == old.index); // слот переиспользован
    assert(fresh != old);
    assert(!s.isAlive(old));
    expectThrows(ErrorCode::NotFound, [&]{ (void)s.name(old); });
    expectThrows(ErrorCode::NotFound, [&]{ s.renameNode(old, "again"); });
    assert(s.name(fresh) == "fresh");
}

static void test_docs_scenario() {
    NodeStore s;
    PathResolver r(s);
    auto docs = s.createNode(s.root(), "docs", NodeKind::Directory);
    auto a = s.createNode(docs, "a.txt", NodeKind::File);
    s.updateContent(a, "hi");
    assert(s.size(a) == std::size_t{2});
    assert(r.resolve("/docs/a.txt") == a);

    s.deleteNode(docs);
    assert(s.childCount(s.root()) == 0);
    assert(!s.isAlive(a));
    expectThrows(ErrorCode::NotFound, [&]{ (void)r.resolve("/docs/a.txt"); });
}

int main() {
    test_remove_file_twice();
    test_recursive_directory_removal();
    test_splice_keeps_sibling_order();
    test_remove_root_is_forbidden();
    test_stale_handle_never_aliases_new_node();
    test_docs_scenario();
    std::cout << "[OK] test_rm\n";
}
