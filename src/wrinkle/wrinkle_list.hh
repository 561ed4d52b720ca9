#pragma once

#include <wrinkle/assertf.hh>
#include <wrinkle/error.hh>
#include <wrinkle/fwd.hh>
#include <wrinkle/node_chain.hh>
#include <wrinkle/sequence.hh>
#include <wrinkle/to_debug_string.hh>
#include <wrinkle/utility.hh>
#include <wrinkle/wrinkle_chain.hh>

#include <initializer_list>
#include <string>
#include <vector>

/// Indexable sequence for workloads that alternate bursts of positional insert/remove with long
/// read-heavy phases.
///
/// Storage model:
///   - node chain: doubly-linked nodes in a slab, the ground truth of content and order
///   - backbone:   node ids captured by the last snapshot(), backbone[i] was the node at position i
///   - wrinkles:   ascending (slot, offset) corrections accumulated by edits since that snapshot
///
/// A positional lookup translates the logical index to a backbone slot through the wrinkle chain,
/// jumps to that slot's node and walks backward for the few positions a wrinkle run introduces.
/// Cost is O(#wrinkles + run length) instead of O(n) for a plain linked list, and edits cost the
/// same plus O(1) splicing instead of O(n) shifting for a plain array.
///
/// Call snapshot() after a burst of edits to flatten the wrinkles again (O(n)). It is never called implicitly.
///
/// Appending never produces a wrinkle: the tail beyond the backbone is reached through the tail node.
///
/// Errors:
///   - index violations throw wr::sequence_error with error_kind::out_of_range
///   - cursors throw stale_cursor / illegal_cursor_state / exhausted, see cursor
///   - a throwing call leaves the list unchanged
///
/// Not internally synchronized.
template <class T>
struct wr::wrinkle_list
{
public:
    using value_type = T;

    struct cursor;

    // element access
public:
    /// element at logical position index, 0 <= index < size()
    [[nodiscard]] T const& get(isize index) const
    {
        impl::check_element_index(index, size());
        return _nodes.value(impl_locate(index).node);
    }

    [[nodiscard]] T& operator[](isize index)
    {
        impl::check_element_index(index, size());
        return _nodes.value(impl_locate(index).node);
    }
    [[nodiscard]] T const& operator[](isize index) const { return get(index); }

    /// replaces the element at index and returns the previous one
    T set(isize index, T value)
    {
        impl::check_element_index(index, size());
        return wr::exchange(_nodes.value(impl_locate(index).node), wr::move(value));
    }

    [[nodiscard]] T& front()
    {
        impl::check_element_index(0, size());
        return _nodes.value(_nodes.head());
    }
    [[nodiscard]] T const& front() const
    {
        impl::check_element_index(0, size());
        return _nodes.value(_nodes.head());
    }

    [[nodiscard]] T& back()
    {
        impl::check_element_index(size() - 1, size());
        return _nodes.value(_nodes.tail());
    }
    [[nodiscard]] T const& back() const
    {
        impl::check_element_index(size() - 1, size());
        return _nodes.value(_nodes.tail());
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _nodes.size(); }
    [[nodiscard]] bool empty() const { return _nodes.empty(); }

    /// number of slots captured by the last snapshot()
    [[nodiscard]] isize backbone_size() const { return isize(_backbone.size()); }

    /// corrections accumulated since the last snapshot()
    [[nodiscard]] wrinkle_chain const& wrinkles() const { return _wrinkles; }

    /// bumped on every structural edit (insert, remove, snapshot, clear)
    [[nodiscard]] u64 generation() const { return _generation; }

    // modifiers
public:
    /// appends an element constructed from args, O(1)
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        auto const id = _nodes.emplace_back(wr::forward<Args>(args)...);
        ++_generation;
        return _nodes.value(id);
    }

    void push_back(T const& value) { emplace_back(value); }
    void push_back(T&& value) { emplace_back(wr::move(value)); }

    /// inserts value so that it ends up at logical position index, 0 <= index <= size()
    void insert_at(isize index, T value)
    {
        impl::check_position(index, size());

        if (index == size())
        {
            emplace_back(wr::move(value));
            return;
        }

        auto const [after, slot] = impl_locate(index);
        _wrinkles.reserve_for_add();
        _nodes.emplace_before(after, wr::move(value));
        _wrinkles.add(slot, +1);
        ++_generation;
    }

    /// removes and returns the element at index, 0 <= index < size()
    [[nodiscard]] T pop_at(isize index)
    {
        impl::check_element_index(index, size());
        return impl_remove_at(index);
    }

    /// removes the element at index, 0 <= index < size()
    void remove_at(isize index)
    {
        impl::check_element_index(index, size());
        impl_remove_at(index);
    }

    /// removes [from, to), 0 <= from <= to <= size()
    /// walks backward from `to` so that no removal shifts a position still to be visited
    void remove_range(isize from, isize to)
    {
        if (from < 0 || from > to || to > size()) [[unlikely]]
            impl::throw_range_out_of_range(from, to, size(), wr::source_location::current());

        auto c = cursor_at(to);
        while (c.previous_index() >= from)
        {
            c.previous();
            c.remove_last();
        }
    }

    /// removes all elements, the backbone and all wrinkles
    void clear()
    {
        _nodes.clear();
        _backbone.clear();
        _wrinkles.reset(0);
        ++_generation;
    }

    /// rebuilds the backbone from the current chain and drops all wrinkles, O(n)
    /// content and size are unchanged, but open cursors become stale
    void snapshot()
    {
        std::vector<node_id> backbone;
        backbone.reserve(size());
        for (auto id = _nodes.head(); id != node_id::none; id = _nodes.next_of(id))
            backbone.push_back(id);

        _backbone = wr::move(backbone);
        _wrinkles.reset(isize(_backbone.size()));
        ++_generation;
    }

    // cursors
public:
    /// bidirectional cursor positioned before the element at index, 0 <= index <= size()
    [[nodiscard]] cursor cursor_at(isize index = 0) { return cursor(*this, index); }

    // iteration
public:
    template <class ListT, class ElemT>
    struct impl_iterator
    {
        ListT* list = nullptr;
        node_id node = node_id::none;
        u64 generation = 0;

        ElemT& operator*() const
        {
            WR_ASSERT(generation == list->_generation, "list was modified during iteration");
            return list->_nodes.value(node);
        }
        impl_iterator& operator++()
        {
            WR_ASSERT(generation == list->_generation, "list was modified during iteration");
            node = list->_nodes.next_of(node);
            return *this;
        }
        bool operator!=(wr::sentinel) const { return node != node_id::none; }
        bool operator==(wr::sentinel) const { return node == node_id::none; }
    };

    using iterator = impl_iterator<wrinkle_list, T>;
    using const_iterator = impl_iterator<wrinkle_list const, T const>;

    [[nodiscard]] iterator begin() { return {this, _nodes.head(), _generation}; }
    [[nodiscard]] const_iterator begin() const { return {this, _nodes.head(), _generation}; }
    [[nodiscard]] wr::sentinel end() const { return {}; }

    // diagnostics
public:
    /// renders the internal layout, e.g. {[0], [1], (7, [2]), X, [4]}, (5), (6)
    ///   {...}       backbone slots
    ///   [v]         node a slot points to
    ///   (a, b, [v]) inserted nodes a, b in front of the slot node v
    ///   X           slot whose node was removed
    ///   (v) after } appended tail nodes
    /// format is for humans only
    [[nodiscard]] std::string to_structure_string() const
    {
        std::string s = "{";

        auto node = _nodes.head();
        auto const* w = _wrinkles.begin();
        isize offset = 0;
        isize prev_logical = -1;

        for (isize slot = 0; slot < backbone_size(); ++slot)
        {
            if (slot > 0)
                s += ", ";

            if (w != _wrinkles.end() && w->index == slot)
            {
                offset += w->offset;
                ++w;
            }

            // nodes between the previous slot's node and this slot's node, including the latter
            auto const logical = slot + offset;
            auto const count = logical - prev_logical;
            prev_logical = logical > prev_logical ? logical : prev_logical;

            if (count <= 0)
            {
                s += "X";
            }
            else if (count == 1 && node != node_id::none)
            {
                s += "[";
                s += wr::to_debug_string(_nodes.value(node));
                s += "]";
                node = _nodes.next_of(node);
            }
            else
            {
                s += "(";
                for (isize i = 0; i < count && node != node_id::none; ++i)
                {
                    if (i > 0)
                        s += ", ";
                    auto const is_base = i == count - 1;
                    if (is_base)
                        s += "[";
                    s += wr::to_debug_string(_nodes.value(node));
                    if (is_base)
                        s += "]";
                    node = _nodes.next_of(node);
                }
                s += ")";
            }
        }

        s += "}";

        for (; node != node_id::none; node = _nodes.next_of(node))
        {
            s += ", (";
            s += wr::to_debug_string(_nodes.value(node));
            s += ")";
        }

        return s;
    }

    /// full O(n) consistency check of chain, backbone and wrinkles
    /// every backbone slot a lookup can start from must map to the node it references
    [[nodiscard]] bool check_invariants() const
    {
        // chain links
        std::vector<node_id> order;
        order.reserve(size());
        auto prev = node_id::none;
        for (auto id = _nodes.head(); id != node_id::none; id = _nodes.next_of(id))
        {
            if (_nodes.prev_of(id) != prev)
                return false;
            if (isize(order.size()) >= size())
                return false; // cycle or miscounted size
            order.push_back(id);
            prev = id;
        }
        if (prev != _nodes.tail() || isize(order.size()) != size())
            return false;

        // wrinkles
        if (!_wrinkles.is_well_formed() || _wrinkles.backbone_length() != backbone_size())
            return false;

        // backbone
        // slots with negative logical position lost their node at the front and are never used,
        // slots sharing the logical position of their predecessor are shadowed by it
        isize prev_logical = -1;
        for (isize slot = 0; slot < backbone_size(); ++slot)
        {
            auto const logical = _wrinkles.to_logical(slot);
            if (logical < prev_logical)
                return false;

            auto const shadowed = slot > 0 && logical == prev_logical;
            if (logical >= 0 && !shadowed)
            {
                if (logical >= size() || order[logical] != _backbone[slot])
                    return false;
            }

            prev_logical = logical;
        }

        return true;
    }

    // comparison
public:
    /// element-wise, independent of backbone and wrinkle state
    [[nodiscard]] friend bool operator==(wrinkle_list const& lhs, wrinkle_list const& rhs)
    {
        return wr::sequences_equal(lhs, rhs);
    }

    // ctors
public:
    wrinkle_list() = default;
    ~wrinkle_list() = default;

    /// appends all items, no snapshot is taken
    wrinkle_list(std::initializer_list<T> items)
    {
        for (auto const& v : items)
            _nodes.emplace_back(v);
    }

    // value semantics: node ids are slab indices, so a copy is consistent as-is
    wrinkle_list(wrinkle_list&&) = default;
    wrinkle_list& operator=(wrinkle_list&&) = default;
    wrinkle_list(wrinkle_list const&) = default;
    wrinkle_list& operator=(wrinkle_list const&) = default;

    // impl
private:
    struct located
    {
        node_id node;
        isize slot;
    };

    // node at logical position index together with the backbone slot it was resolved through
    [[nodiscard]] located impl_locate(isize index) const
    {
        auto const slot = _wrinkles.to_backbone(index);
        return {impl_grab(slot, index), slot};
    }

    // node at logical position index, starting the backward walk at backbone slot `slot`
    [[nodiscard]] node_id impl_grab(isize slot, isize index) const
    {
        // most access patterns touch the ends
        if (index == 0)
            return _nodes.head();
        if (index == size() - 1)
            return _nodes.tail();

        auto node = node_id::none;
        isize logical = 0;
        if (slot == backbone_size())
        {
            node = _nodes.tail();
            logical = size() - 1;
        }
        else
        {
            node = _backbone[slot];
            logical = _wrinkles.to_logical(slot);
        }

        WR_ASSERTF(node != node_id::none && logical >= index, "backbone slot {} (logical {}) cannot reach index {}", slot,
                   logical, index);

        for (; logical > index; --logical)
            node = _nodes.prev_of(node);

        return node;
    }

    // a slot referencing a node about to be removed moves to its predecessor,
    // or to none if the node is the head (such a slot is never a lookup start again)
    void impl_repoint_backbone(isize slot, node_id removed)
    {
        if (slot < backbone_size() && _backbone[slot] == removed)
            _backbone[slot] = _nodes.prev_of(removed);
    }

    // unlinks a node that was resolved through `slot` and records the wrinkle
    T impl_unlink(node_id node, isize slot)
    {
        _wrinkles.reserve_for_add();
        impl_repoint_backbone(slot, node);
        _wrinkles.add(slot, -1);
        ++_generation;
        return _nodes.unlink(node);
    }

    T impl_remove_at(isize index)
    {
        auto const [node, slot] = impl_locate(index);
        return impl_unlink(node, slot);
    }

    // members
private:
    node_chain<T> _nodes;
    std::vector<node_id> _backbone;
    wrinkle_chain _wrinkles;
    u64 _generation = 0;
};

/// Stateful bidirectional position in a wrinkle_list, between previous_index() and next_index().
///
/// Fail-fast: every operation except the position queries throws error_kind::stale_cursor once the list
/// was structurally modified by anything but this cursor. Edits made through the cursor itself
/// (insert, remove_last) keep it valid.
///
/// States: fresh (no last element) and positioned (after next()/previous()).
/// set_last/remove_last require positioned; remove_last and insert return to fresh.
/// Exhausting one direction is not terminal, the cursor can always turn around.
///
/// The cursor keeps a pointer to its list: the list must outlive it and must not be moved meanwhile.
template <class T>
struct wr::wrinkle_list<T>::cursor
{
    // queries
public:
    [[nodiscard]] bool has_next() const { return _next != node_id::none; }
    [[nodiscard]] bool has_previous() const { return _index != 0; }

    [[nodiscard]] isize next_index() const { return _index; }
    [[nodiscard]] isize previous_index() const { return _index - 1; }

    // traversal
public:
    /// returns the next element and moves past it
    T& next()
    {
        impl_check_generation();
        if (_next == node_id::none) [[unlikely]]
            impl::throw_exhausted(_index, _list->size(), true, wr::source_location::current());

        _last = _next;
        _last_slot = _slot;
        _next = _list->_nodes.next_of(_next);
        ++_index;
        _slot = _list->_wrinkles.to_backbone(_index);
        return _list->_nodes.value(_last);
    }

    /// returns the previous element and moves before it
    T& previous()
    {
        impl_check_generation();
        if (_index == 0) [[unlikely]]
            impl::throw_exhausted(_index, _list->size(), false, wr::source_location::current());

        // at the tail end the previous element is the tail
        _next = _next == node_id::none ? _list->_nodes.tail() : _list->_nodes.prev_of(_next);
        _last = _next;
        --_index;
        _slot = _list->_wrinkles.to_backbone(_index);
        _last_slot = _slot;
        return _list->_nodes.value(_last);
    }

    // modification
public:
    /// replaces the element last returned by next()/previous()
    void set_last(T value)
    {
        impl_check_generation();
        if (_last == node_id::none) [[unlikely]]
            impl::throw_illegal_cursor_state(_index, _list->size(), wr::source_location::current());

        _list->_nodes.value(_last) = wr::move(value);
    }

    /// removes the element last returned by next()/previous()
    void remove_last()
    {
        impl_check_generation();
        if (_last == node_id::none) [[unlikely]]
            impl::throw_illegal_cursor_state(_index, _list->size(), wr::source_location::current());

        // removed behind us after next(), or in front of us after previous()
        auto const next = _next == _last ? _list->_nodes.next_of(_last) : _next;
        auto const index = _next == _last ? _index : _index - 1;

        // the wrinkle belongs to the slot the removed node was resolved through, not the current one
        _list->impl_unlink(_last, _last_slot);

        _next = next;
        _index = index;
        _last = node_id::none;
        _generation = _list->_generation;
        _slot = _list->_wrinkles.to_backbone(_index);
    }

    /// inserts value at the cursor position: before next(), after previous()
    void insert(T value)
    {
        impl_check_generation();

        auto& list = *_list;
        if (_next == node_id::none)
        {
            // empty list or tail end: plain append, tail growth needs no wrinkle
            list._nodes.emplace_back(wr::move(value));
        }
        else
        {
            // head or interior: splice before next and shift its slot
            // at the head _slot is to_backbone(0), i.e. slot 0 unless front slots lost their nodes
            list._wrinkles.reserve_for_add();
            list._nodes.emplace_before(_next, wr::move(value));
            list._wrinkles.add(_slot, +1);
        }

        ++list._generation;
        ++_index;
        _last = node_id::none;
        _generation = list._generation;
        _slot = list._wrinkles.to_backbone(_index);
    }

    // ctors
public:
    cursor(cursor const&) = default;
    cursor& operator=(cursor const&) = default;

    // impl
private:
    cursor(wrinkle_list& list, isize index) : _list(&list)
    {
        impl::check_position(index, list.size());

        _index = index;
        _slot = list._wrinkles.to_backbone(index);
        _next = index == list.size() ? node_id::none : list.impl_grab(_slot, index);
        _generation = list._generation;
    }

    void impl_check_generation(wr::source_location site = wr::source_location::current()) const
    {
        if (_generation != _list->_generation) [[unlikely]]
            impl::throw_stale_cursor(_index, _list->size(), site);
    }

    // members
private:
    wrinkle_list* _list = nullptr;

    // node at next_index(), none at the tail end
    node_id _next = node_id::none;
    // node returned by the last next()/previous(), none in the fresh state
    node_id _last = node_id::none;

    isize _index = 0;
    // to_backbone(_index)
    isize _slot = 0;
    // to_backbone(position of _last)
    isize _last_slot = 0;

    // list generation this cursor is valid for
    u64 _generation = 0;

    friend wrinkle_list;
};
