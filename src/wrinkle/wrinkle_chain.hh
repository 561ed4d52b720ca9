#pragma once

#include <wrinkle/fwd.hh>

#include <vector>

/// A correction record: logical positions of backbone slots >= index are shifted by offset
/// (cumulatively with all wrinkles at smaller indices).
/// offset is never zero inside a wrinkle_chain.
struct wr::wrinkle
{
    isize index = 0;
    isize offset = 0;

    friend bool operator==(wrinkle const&, wrinkle const&) = default;
};

/// Ascending chain of wrinkles that reconciles stale backbone slots with current logical positions.
///
/// Between two snapshots of a wrinkle_list, every insertion or removal strictly inside the backbone
/// range adds a +1 / -1 delta at the backbone slot the edit was resolved through.
/// Deltas at the same slot are merged, and a wrinkle whose offset drops to zero disappears,
/// so the chain length is bounded by the number of distinct edit sites since the last snapshot.
///
/// Invariants:
///   - strictly ascending by index, no duplicates
///   - 0 <= index < backbone_length
///   - offset != 0
///
/// Edits at or beyond backbone_length (the appended tail) never produce a wrinkle.
///
/// All operations are O(number of wrinkles), independent of the list size.
/// The translation functions are pure.
struct wr::wrinkle_chain
{
    // translation
public:
    /// current logical position of backbone slot `backbone_index`:
    /// backbone_index plus the offsets of all wrinkles with index <= backbone_index
    [[nodiscard]] isize to_logical(isize backbone_index) const;

    /// backbone slot to start a lookup of `logical_index` from.
    /// The result is one of
    ///   - the slot of the last wrinkle passed, if its logical position already exceeds logical_index
    ///     (the target sits inside that wrinkle's run of inserted nodes, walk backward from the slot)
    ///   - backbone_length, if the target lies in the appended tail (walk backward from the tail)
    ///   - the slot whose logical position is exactly logical_index
    [[nodiscard]] isize to_backbone(isize logical_index) const;

    // modifiers
public:
    /// records an offset delta at backbone slot `backbone_index`.
    /// no-op for slots >= backbone_length.
    /// merges into an existing wrinkle at the same slot and drops it if the offset reaches zero.
    /// strong exception guarantee
    void add(isize backbone_index, isize offset);

    /// makes sure that the next add() does not allocate
    void reserve_for_add();

    /// drops all wrinkles and rebinds the chain to a backbone of the given length
    void reset(isize backbone_length);

    /// drops all wrinkles, keeps the backbone length
    void clear() { _wrinkles.clear(); }

    // queries
public:
    [[nodiscard]] isize backbone_length() const { return _backbone_length; }

    [[nodiscard]] isize size() const { return isize(_wrinkles.size()); }
    [[nodiscard]] bool empty() const { return _wrinkles.empty(); }

    [[nodiscard]] wrinkle const& operator[](isize i) const;

    [[nodiscard]] wrinkle const* begin() const { return _wrinkles.data(); }
    [[nodiscard]] wrinkle const* end() const { return _wrinkles.data() + _wrinkles.size(); }

    /// checks ordering, bounds and nonzero offsets
    [[nodiscard]] bool is_well_formed() const;

    // members
private:
    std::vector<wrinkle> _wrinkles;
    isize _backbone_length = 0;
};
