// vnm_flatland slot table tests

#include <vnm_flatland/core/slot_table.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace fl = vnm::flatland;

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while (0)

bool test_insert_assigns_sequential_indices()
{
    fl::Slot_table<std::string> table;
    const auto a = table.insert("a");
    const auto b = table.insert("b");
    const auto c = table.insert("c");

    TEST_ASSERT(a.index == 0 && b.index == 1 && c.index == 2, "fresh slots should be appended in order");
    TEST_ASSERT(table.size() == 3, "size should count live slots");
    TEST_ASSERT(*table.get(b) == "b", "get should return the stored value");
    return true;
}

bool test_erase_and_reuse_advances_generation()
{
    fl::Slot_table<int> table;
    const auto first = table.insert(10);
    table.insert(20);

    TEST_ASSERT(table.erase(first), "erase of a live slot should succeed");
    TEST_ASSERT(!table.contains(first), "erased slot should no longer resolve");
    TEST_ASSERT(table.size() == 1, "size should drop after erase");

    const auto reused = table.insert(30);
    TEST_ASSERT(reused.index == first.index, "freed index should be reused");
    TEST_ASSERT(reused.generation != first.generation, "reuse should advance the generation");
    TEST_ASSERT(table.get(first) == nullptr, "stale id must not resolve to the new occupant");
    TEST_ASSERT(*table.get(reused) == 30, "new id should resolve to the new value");
    TEST_ASSERT(table.slot_count() == 2, "reuse should not grow the table");
    return true;
}

bool test_double_erase_is_rejected()
{
    fl::Slot_table<int> table;
    const auto id = table.insert(1);
    TEST_ASSERT(table.erase(id), "first erase should succeed");
    TEST_ASSERT(!table.erase(id), "second erase should fail");
    TEST_ASSERT(table.size() == 0, "size must not underflow");

    const fl::slot_id_t out_of_range{42, 0};
    TEST_ASSERT(!table.erase(out_of_range), "erase of an unknown index should fail");
    TEST_ASSERT(table.get(out_of_range) == nullptr, "unknown index should not resolve");
    return true;
}

bool test_for_each_visits_live_slots_in_index_order()
{
    fl::Slot_table<int> table;
    const auto a = table.insert(1);
    const auto b = table.insert(2);
    table.insert(3);
    table.erase(b);
    (void)a;

    std::vector<std::uint32_t> indices;
    std::vector<int> values;
    table.for_each([&](fl::slot_id_t id, const int& value) {
        indices.push_back(id.index);
        values.push_back(value);
    });

    TEST_ASSERT(indices.size() == 2, "only live slots should be visited");
    TEST_ASSERT(indices[0] == 0 && indices[1] == 2, "slots should be visited in index order");
    TEST_ASSERT(values[0] == 1 && values[1] == 3, "values should match their slots");
    return true;
}

bool test_free_list_is_lifo()
{
    fl::Slot_table<int> table;
    const auto a = table.insert(1);
    const auto b = table.insert(2);
    table.erase(a);
    table.erase(b);

    TEST_ASSERT(table.insert(3).index == b.index, "most recently freed slot should be reused first");
    TEST_ASSERT(table.insert(4).index == a.index, "older free slot should be reused next");
    TEST_ASSERT(table.slot_count() == 2, "no new slots should be appended");
    return true;
}

} // namespace

int main()
{
    std::cout << "Slot table tests" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_insert_assigns_sequential_indices);
    RUN_TEST(test_erase_and_reuse_advances_generation);
    RUN_TEST(test_double_erase_is_rejected);
    RUN_TEST(test_for_each_visits_live_slots_in_index_order);
    RUN_TEST(test_free_list_is_lifo);

    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
