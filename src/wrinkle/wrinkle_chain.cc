#include "wrinkle_chain.hh"

#include <wrinkle/assertf.hh>

wr::isize wr::wrinkle_chain::to_logical(isize backbone_index) const
{
    auto index = backbone_index;
    for (auto const& w : _wrinkles)
    {
        if (w.index > backbone_index)
            break;
        index += w.offset;
    }
    return index;
}

wr::isize wr::wrinkle_chain::to_backbone(isize logical_index) const
{
    // backbone slot of the last wrinkle passed
    isize last_seen = 0;
    // sum of the offsets of all wrinkles passed
    isize total_offset = 0;

    // stop at the first wrinkle whose own logical position lies beyond logical_index
    for (auto const& w : _wrinkles)
    {
        if (w.index + total_offset > logical_index)
            break;
        last_seen = w.index;
        total_offset += w.offset;
    }

    // inside the run of the wrinkle just passed
    if (last_seen + total_offset > logical_index)
        return last_seen;

    // in the appended tail
    if (logical_index - total_offset > _backbone_length)
        return _backbone_length;

    // untouched backbone territory (== _backbone_length for the first tail element)
    return logical_index - total_offset;
}

void wr::wrinkle_chain::add(isize backbone_index, isize offset)
{
    WR_ASSERTF(backbone_index >= 0, "wrinkle at negative backbone slot {}", backbone_index);
    WR_ASSERT(offset != 0, "zero-offset wrinkles are never stored");

    // edits in the tail are tracked by the tail itself
    if (backbone_index >= _backbone_length)
        return;

    // first wrinkle with index >= backbone_index
    // (everything before it is the predecessor run with index < backbone_index)
    auto pos = _wrinkles.begin();
    while (pos != _wrinkles.end() && pos->index < backbone_index)
        ++pos;

    if (pos != _wrinkles.end() && pos->index == backbone_index)
    {
        pos->offset += offset;
        if (pos->offset == 0)
            _wrinkles.erase(pos);
        return;
    }

    _wrinkles.insert(pos, wrinkle{backbone_index, offset});
}

void wr::wrinkle_chain::reserve_for_add()
{
    if (_wrinkles.size() == _wrinkles.capacity())
        _wrinkles.reserve(_wrinkles.empty() ? 8 : _wrinkles.size() * 2);
}

void wr::wrinkle_chain::reset(isize backbone_length)
{
    WR_ASSERTF(backbone_length >= 0, "negative backbone length {}", backbone_length);
    _wrinkles.clear();
    _backbone_length = backbone_length;
}

wr::wrinkle const& wr::wrinkle_chain::operator[](isize i) const
{
    WR_ASSERTF(0 <= i && i < isize(_wrinkles.size()), "wrinkle {} out of bounds (count: {})", i, _wrinkles.size());
    return _wrinkles[i];
}

bool wr::wrinkle_chain::is_well_formed() const
{
    isize prev_index = -1;
    for (auto const& w : _wrinkles)
    {
        if (w.offset == 0)
            return false;
        if (w.index <= prev_index || w.index >= _backbone_length)
            return false;
        prev_index = w.index;
    }
    return true;
}
