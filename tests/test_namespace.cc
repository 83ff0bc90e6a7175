#include "test_helpers.h"

namespace {

// /docs/guide/intro (note), /docs/faq (note), /docs (note too), /empty
struct Layout {
    uint64_t docs;
    uint64_t guide;
    uint64_t empty;
    uint64_t intro;
    uint64_t faq;
    uint64_t docs_note;
};

Layout build(Kb &kb) {
    Layout l;
    l.docs = kb.mkdir(kRootDirId, "docs");
    l.guide = kb.mkdir(l.docs, "guide");
    l.empty = kb.mkdir(kRootDirId, "empty");
    l.intro = kb.mknote(l.guide, "intro", "welcome");
    l.faq = kb.mknote(l.docs, "faq");
    l.docs_note = kb.mknote(kRootDirId, "docs");
    return l;
}

} // namespace

TEST_CASE("resolve_path walks directories from the root") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    Layout l = build(kb);

    auto [s, root] = kb.ns->resolve_path("/");
    REQUIRE(s.ok());
    CHECK(root.kind() == ENTRY_DIRECTORY);
    CHECK(root.id() == kRootDirId);
    CHECK(kb.ns->resolve_path("").second.id() == kRootDirId);

    auto [s2, intro] = kb.ns->resolve_path("/docs/guide/intro");
    REQUIRE(s2.ok());
    CHECK(intro.kind() == ENTRY_NOTE);
    CHECK(intro.id() == l.intro);
    CHECK(intro.name() == "intro");

    // Extra separators are ignored.
    CHECK(kb.ns->resolve_path("docs//guide/").second.id() == l.guide);

    // "docs" names both a directory and a note; the directory wins.
    auto [s3, docs] = kb.ns->resolve_path("/docs");
    REQUIRE(s3.ok());
    CHECK(docs.kind() == ENTRY_DIRECTORY);
    CHECK(docs.id() == l.docs);
}

TEST_CASE("resolve_path does not descend through notes") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    build(kb);

    CHECK(kb.ns->resolve_path("/docs/faq/x").first.IsNotFound());
    CHECK(kb.ns->resolve_path("/missing").first.IsNotFound());
    CHECK(kb.ns->resolve_path("/docs/missing/intro").first.IsNotFound());
}

TEST_CASE("directory_path rebuilds absolute paths") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    Layout l = build(kb);

    CHECK(kb.ns->directory_path(kRootDirId).second == "/");
    CHECK(kb.ns->directory_path(l.docs).second == "/docs");
    CHECK(kb.ns->directory_path(l.guide).second == "/docs/guide");
    CHECK(kb.ns->directory_path(99).first.IsNotFound());
}

TEST_CASE("Parent and name queries") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    Layout l = build(kb);

    auto [s, root_parent] = kb.ns->directory_parent(kRootDirId);
    REQUIRE(s.ok());
    CHECK_FALSE(root_parent.has_value());
    CHECK_FALSE(kb.ns->directory_name(kRootDirId).second.has_value());

    CHECK(kb.ns->directory_parent(l.guide).second == l.docs);
    CHECK(kb.ns->directory_name(l.guide).second == std::string("guide"));
    CHECK(kb.ns->directory_parent(99).first.IsNotFound());
    CHECK(kb.ns->directory_name(99).first.IsNotFound());

    CHECK(kb.ns->note_parent(l.intro).second == l.guide);
    CHECK(kb.ns->note_name(l.faq).second == "faq");
    CHECK(kb.ns->note_parent(99).first.IsNotFound());
    CHECK(kb.ns->note_name(99).first.IsNotFound());
}

TEST_CASE("Ancestry queries through the namespace") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    Layout l = build(kb);

    CHECK(kb.ns->is_ancestor(kRootDirId, l.guide));
    CHECK(kb.ns->is_ancestor(l.docs, l.guide));
    CHECK(kb.ns->is_ancestor(l.guide, l.guide));
    CHECK_FALSE(kb.ns->is_ancestor(l.empty, l.guide));
    CHECK_FALSE(kb.ns->is_ancestor(l.guide, l.docs));

    CHECK(kb.ns->descendants(l.docs) == std::set<uint64_t>{l.docs, l.guide});
    CHECK(kb.ns->owned_notes(l.docs) == std::set<uint64_t>{l.intro, l.faq});
    CHECK(kb.ns->owned_notes(l.empty).empty());
}

TEST_CASE("subtree returns directories and notes together") {
    TempDir dir;
    Kb kb(dir.path());
    kb.grant_edit(kEditor);
    Layout l = build(kb);

    auto [s, tree] = kb.ns->subtree(l.docs);
    REQUIRE(s.ok());
    CHECK(tree.dirs == std::set<uint64_t>{l.docs, l.guide});
    CHECK(tree.notes == std::set<uint64_t>{l.intro, l.faq});

    auto [s2, leaf] = kb.ns->subtree(l.empty);
    REQUIRE(s2.ok());
    CHECK(leaf.dirs == std::set<uint64_t>{l.empty});
    CHECK(leaf.notes.empty());

    CHECK(kb.ns->subtree(99).first.IsNotFound());
}
