#pragma once

#include "tree_index.h"

#include <cstdint>
#include <set>
#include <vector>

// Closure queries over the directory-parent relation. Read-only; the caller
// holds the store lock for as long as the answer has to stay valid.
class AncestryOracle {
  public:
    explicit AncestryOracle(const TreeIndex &index) : index_(index) {}

    // True iff `candidate` lies on the path from `target` up to the root,
    // `target` itself included.
    bool is_ancestor(uint64_t candidate, uint64_t target) const;

    // True iff walking up from `dir` reaches the root within the number of
    // live directories, i.e. `dir` is connected and not on a cycle.
    bool rooted(uint64_t dir) const;

    // Every directory of the subtree at `root`, `root` included. Empty if
    // `root` does not exist.
    std::set<uint64_t> descendants(uint64_t root) const;

    // Every note parented anywhere in the subtree at `root`.
    std::set<uint64_t> owned_notes(uint64_t root) const;

    // The same subtree, ordered so that every directory comes after all of
    // its descendants.
    std::vector<uint64_t> post_order(uint64_t root) const;

  private:
    const TreeIndex &index_;
};
