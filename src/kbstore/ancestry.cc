#include "ancestry.h"

#include <utility>

bool AncestryOracle::is_ancestor(uint64_t candidate, uint64_t target) const {
    if (!index_.has_dir(target) || !index_.has_dir(candidate))
        return false;

    // The forest invariant bounds the walk by the tree depth; the step limit
    // only stops a corrupted graph from spinning forever.
    size_t steps = index_.dir_count();
    uint64_t cur = target;
    for (;;) {
        if (cur == candidate)
            return true;
        const DirRecord *rec = index_.dir(cur);
        if (rec == nullptr || !rec->attached || steps-- == 0)
            return false;
        cur = rec->parent;
    }
}

bool AncestryOracle::rooted(uint64_t dir) const {
    if (!index_.has_dir(dir))
        return false;
    size_t steps = index_.dir_count();
    uint64_t cur = dir;
    while (cur != kRootDirId) {
        const DirRecord *rec = index_.dir(cur);
        if (rec == nullptr || !rec->attached || steps-- == 0)
            return false;
        cur = rec->parent;
    }
    return true;
}

std::set<uint64_t> AncestryOracle::descendants(uint64_t root) const {
    std::set<uint64_t> result;
    if (!index_.has_dir(root))
        return result;

    std::vector<uint64_t> worklist{root};
    while (!worklist.empty()) {
        uint64_t cur = worklist.back();
        worklist.pop_back();
        if (!result.insert(cur).second)
            continue;
        const DirRecord *rec = index_.dir(cur);
        if (rec == nullptr)
            continue;
        for (const auto &[name, child] : rec->subdirs)
            worklist.push_back(child);
    }
    return result;
}

std::set<uint64_t> AncestryOracle::owned_notes(uint64_t root) const {
    std::set<uint64_t> result;
    for (uint64_t dir : descendants(root)) {
        const DirRecord *rec = index_.dir(dir);
        for (const auto &[name, note] : rec->notes)
            result.insert(note);
    }
    return result;
}

std::vector<uint64_t> AncestryOracle::post_order(uint64_t root) const {
    std::vector<uint64_t> order;
    if (!index_.has_dir(root))
        return order;

    // (directory, children already pushed)
    std::vector<std::pair<uint64_t, bool>> stack{{root, false}};
    std::set<uint64_t> seen;
    while (!stack.empty()) {
        auto &[cur, expanded] = stack.back();
        if (expanded) {
            order.push_back(cur);
            stack.pop_back();
            continue;
        }
        expanded = true;
        if (!seen.insert(cur).second) {
            stack.pop_back();
            continue;
        }
        const DirRecord *rec = index_.dir(cur);
        if (rec == nullptr)
            continue;
        for (const auto &[name, child] : rec->subdirs)
            stack.emplace_back(child, false);
    }
    return order;
}
