#include <wrinkle/wrinkle_list.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
wr::wrinkle_list<int> make_list(int n)
{
    wr::wrinkle_list<int> list;
    for (auto i = 0; i < n; ++i)
        list.push_back(i);
    list.snapshot();
    return list;
}
} // namespace

TEST("structure dump - plain backbone")
{
    auto list = make_list(4);
    CHECK(list.to_structure_string() == "{[0], [1], [2], [3]}");
}

TEST("structure dump - everything in the tail before the first snapshot")
{
    wr::wrinkle_list<int> list = {1, 2};
    CHECK(list.to_structure_string() == "{}, (1), (2)");
}

TEST("structure dump - appended tail")
{
    auto list = make_list(2);
    list.push_back(2);
    list.push_back(3);
    CHECK(list.to_structure_string() == "{[0], [1]}, (2), (3)");
}

TEST("structure dump - inserted run in front of its slot node")
{
    auto list = make_list(5);
    list.insert_at(2, 7);
    CHECK(list.to_structure_string() == "{[0], [1], (7, [2]), [3], [4]}");

    list.insert_at(2, 8);
    CHECK(list.to_structure_string() == "{[0], [1], (8, 7, [2]), [3], [4]}");
}

TEST("structure dump - removed slot node")
{
    auto list = make_list(5);
    list.insert_at(2, 7);
    list.push_back(5);

    // removes the node of slot 3
    list.remove_at(4);
    CHECK(list.to_structure_string() == "{[0], [1], (7, [2]), X, [4]}, (5)");
}

TEST("structure dump - removed head")
{
    auto list = make_list(3);
    list.remove_at(0);
    CHECK(list.to_structure_string() == "{X, [1], [2]}");
}

TEST("structure dump - strings are quoted")
{
    wr::wrinkle_list<std::string> list = {"B0", "B1"};
    list.snapshot();
    list.insert_at(1, "I0");
    CHECK(list.to_structure_string() == "{[\"B0\"], (\"I0\", [\"B1\"])}");
}

TEST("structure dump - snapshot flattens the rendering")
{
    auto list = make_list(3);
    list.insert_at(1, 9);
    list.remove_at(3);
    list.push_back(3);

    list.snapshot();
    CHECK(list.to_structure_string() == "{[0], [9], [1], [3]}");
}
