#pragma once

#include <wrinkle/error.hh>
#include <wrinkle/fwd.hh>
#include <wrinkle/utility.hh>

#include <concepts>
#include <initializer_list>
#include <vector>

// =========================================================================================================
// Positional sequence capability
// =========================================================================================================
//
// sequence_like<S>                - size, positional get/set, append, positional insert/remove
// array_sequence<T>               - contiguous reference implementation of the same contract
// sequences_equal(a, b)           - element-wise equality across any two sequence_likes
//
// Implementations are interchangeable for equality and for lockstep comparisons in tests.
// Maintenance hooks like wrinkle_list::snapshot() are not part of the capability,
// generic code detects them with `requires { s.snapshot(); }`.

namespace wr
{
template <class S>
concept sequence_like = requires(S& s, S const& cs, isize i, typename S::value_type v) {
    { cs.size() } -> std::convertible_to<isize>;
    { cs.empty() } -> std::convertible_to<bool>;
    cs.get(i);
    s.set(i, v);
    s.push_back(v);
    s.insert_at(i, v);
    s.pop_at(i);
    s.remove_at(i);
    s.remove_range(i, i);
    s.clear();
};

/// true iff both sequences hold equal elements in the same order
/// uses range iteration where available, positional get otherwise
template <class A, class B>
[[nodiscard]] bool sequences_equal(A const& a, B const& b)
{
    if (isize(a.size()) != isize(b.size()))
        return false;

    if constexpr (requires { a.begin(); b.begin(); })
    {
        auto it_a = a.begin();
        auto it_b = b.begin();
        for (isize i = 0; i < isize(a.size()); ++i, ++it_a, ++it_b)
            if (!(*it_a == *it_b))
                return false;
    }
    else
    {
        for (isize i = 0; i < isize(a.size()); ++i)
            if (!(a.get(i) == b.get(i)))
                return false;
    }

    return true;
}
} // namespace wr

/// Contiguous sequence with the same positional contract and errors as wrinkle_list.
/// O(1) access, O(n) positional insert/remove.
template <class T>
struct wr::array_sequence
{
public:
    using value_type = T;

    // element access
public:
    [[nodiscard]] T const& get(isize index) const
    {
        impl::check_element_index(index, size());
        return _data[index];
    }

    [[nodiscard]] T& operator[](isize index)
    {
        impl::check_element_index(index, size());
        return _data[index];
    }
    [[nodiscard]] T const& operator[](isize index) const { return get(index); }

    T set(isize index, T value)
    {
        impl::check_element_index(index, size());
        return wr::exchange(_data[index], wr::move(value));
    }

    // queries
public:
    [[nodiscard]] isize size() const { return isize(_data.size()); }
    [[nodiscard]] bool empty() const { return _data.empty(); }

    // modifiers
public:
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        return _data.emplace_back(wr::forward<Args>(args)...);
    }

    void push_back(T const& value) { _data.push_back(value); }
    void push_back(T&& value) { _data.push_back(wr::move(value)); }

    void insert_at(isize index, T value)
    {
        impl::check_position(index, size());
        _data.insert(_data.begin() + index, wr::move(value));
    }

    [[nodiscard]] T pop_at(isize index)
    {
        impl::check_element_index(index, size());
        T value = wr::move(_data[index]);
        _data.erase(_data.begin() + index);
        return value;
    }

    void remove_at(isize index)
    {
        impl::check_element_index(index, size());
        _data.erase(_data.begin() + index);
    }

    void remove_range(isize from, isize to)
    {
        if (from < 0 || from > to || to > size()) [[unlikely]]
            impl::throw_range_out_of_range(from, to, size(), wr::source_location::current());

        _data.erase(_data.begin() + from, _data.begin() + to);
    }

    void clear() { _data.clear(); }

    // iteration
public:
    [[nodiscard]] auto begin() { return _data.begin(); }
    [[nodiscard]] auto begin() const { return _data.begin(); }
    [[nodiscard]] auto end() { return _data.end(); }
    [[nodiscard]] auto end() const { return _data.end(); }

    // comparison
public:
    [[nodiscard]] friend bool operator==(array_sequence const& lhs, array_sequence const& rhs)
    {
        return lhs._data == rhs._data;
    }

    // ctors
public:
    array_sequence() = default;
    array_sequence(std::initializer_list<T> items) : _data(items) {}

    // members
private:
    std::vector<T> _data;
};
