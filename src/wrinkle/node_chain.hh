#pragma once

#include <wrinkle/assertf.hh>
#include <wrinkle/fwd.hh>
#include <wrinkle/utility.hh>

#include <type_traits>
#include <vector>

/// Doubly-linked chain of element-holding nodes, stored in a slab and addressed by node_id.
///
/// The chain owns every node. Links are plain ids, absent links are node_id::none.
/// Ids stay stable for the lifetime of a node; freed slots are recycled by later insertions
/// (free list threaded through the next links of dead slots).
///
/// All link edits are O(1). Insertions offer the strong exception guarantee:
/// the element is constructed before any link is touched.
///
/// This is the ground truth of content and order for wrinkle_list.
/// It knows nothing about positions: positional lookup is the business of the backbone.
template <class T>
struct wr::node_chain
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible (freed slots are reset to T())");
    static_assert(std::is_move_constructible_v<T> && std::is_move_assignable_v<T>, "T must be movable");

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    [[nodiscard]] node_id head() const { return _head; }
    [[nodiscard]] node_id tail() const { return _tail; }

    /// number of slots in the slab (live + free)
    [[nodiscard]] isize slot_count() const { return isize(_nodes.size()); }

    /// true iff id refers to a node that is currently part of the chain
    [[nodiscard]] bool is_live(node_id id) const
    {
        return isize(id) >= 0 && isize(id) < isize(_nodes.size()) && _nodes[isize(id)].live;
    }

    // node access
public:
    [[nodiscard]] T& value(node_id id) { return impl_node(id).value; }
    [[nodiscard]] T const& value(node_id id) const { return impl_node(id).value; }

    [[nodiscard]] node_id next_of(node_id id) const { return impl_node(id).next; }
    [[nodiscard]] node_id prev_of(node_id id) const { return impl_node(id).prev; }

    // modifiers
public:
    /// construct a node from args and link it after the tail
    template <class... Args>
    node_id emplace_back(Args&&... args)
    {
        auto const id = impl_create(wr::forward<Args>(args)...);
        auto& n = _nodes[isize(id)];
        n.prev = _tail;
        n.next = node_id::none;

        if (_tail != node_id::none)
            impl_node(_tail).next = id;
        else
            _head = id;

        _tail = id;
        ++_size;
        return id;
    }

    /// construct a node from args and link it directly before pos
    /// pos must be live; becomes the new head if pos was the head
    template <class... Args>
    node_id emplace_before(node_id pos, Args&&... args)
    {
        WR_ASSERTF(is_live(pos), "emplace_before: node {} is not part of the chain", isize(pos));

        auto const id = impl_create(wr::forward<Args>(args)...);
        auto& n = _nodes[isize(id)];
        auto& after = _nodes[isize(pos)];
        n.prev = after.prev;
        n.next = pos;

        if (after.prev != node_id::none)
            impl_node(after.prev).next = id;
        else
            _head = id;

        after.prev = id;
        ++_size;
        return id;
    }

    /// splice id out of the chain, free its slot and return its element
    T unlink(node_id id)
    {
        auto& n = impl_node(id);

        if (n.prev != node_id::none)
            impl_node(n.prev).next = n.next;
        else
            _head = n.next;

        if (n.next != node_id::none)
            impl_node(n.next).prev = n.prev;
        else
            _tail = n.prev;

        T value = wr::move(n.value);
        n.value = T();
        n.live = false;
        n.prev = node_id::none;
        n.next = _free_head;
        _free_head = id;

        --_size;
        return value;
    }

    /// destroy all nodes and release the slab
    void clear()
    {
        _nodes.clear();
        _free_head = node_id::none;
        _head = node_id::none;
        _tail = node_id::none;
        _size = 0;
    }

    // ctors
public:
    node_chain() = default;
    ~node_chain() = default;
    node_chain(node_chain&&) = default;
    node_chain& operator=(node_chain&&) = default;
    node_chain(node_chain const&) = default;
    node_chain& operator=(node_chain const&) = default;

    // impl
private:
    struct node
    {
        T value;
        node_id prev = node_id::none;
        node_id next = node_id::none;
        bool live = false;
    };

    [[nodiscard]] node& impl_node(node_id id)
    {
        WR_ASSERTF(is_live(id), "node {} is not part of the chain (slots: {})", isize(id), _nodes.size());
        return _nodes[isize(id)];
    }
    [[nodiscard]] node const& impl_node(node_id id) const
    {
        WR_ASSERTF(is_live(id), "node {} is not part of the chain (slots: {})", isize(id), _nodes.size());
        return _nodes[isize(id)];
    }

    // returns an unlinked live node holding T(args...)
    // strong guarantee: if T's construction throws, the slab is unchanged
    template <class... Args>
    [[nodiscard]] node_id impl_create(Args&&... args)
    {
        if (_free_head != node_id::none)
        {
            auto const id = _free_head;
            auto& n = _nodes[isize(id)];
            n.value = T(wr::forward<Args>(args)...);
            _free_head = n.next;
            n.prev = node_id::none;
            n.next = node_id::none;
            n.live = true;
            return id;
        }

        auto const id = node_id(isize(_nodes.size()));
        _nodes.push_back(node{T(wr::forward<Args>(args)...), node_id::none, node_id::none, true});
        return id;
    }

    // members
private:
    std::vector<node> _nodes;

    // first free slot, free slots are chained through node::next
    node_id _free_head = node_id::none;

    node_id _head = node_id::none;
    node_id _tail = node_id::none;
    isize _size = 0;
};
