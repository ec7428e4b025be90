#include <deepeq/assert_test.h>

#include <deepeq/EqualityComparer.hh>

#include <iostream>

using namespace deepeq;

typedef ValueHandle VH;

static std::vector<VH>
ints(std::vector<long long> const& values)
{
    std::vector<VH> result;
    for (auto v: values) {
        result.push_back(VH::newInteger(v));
    }
    return result;
}

static void
test_sequences()
{
    EqualityComparer engine;
    assert(engine.areEqual(VH::newSequence(ints({1, 2, 3})), VH::newSequence(ints({1, 2, 3}))));
    assert(engine.areEqual(VH::newSequence(), VH::newSequence()));

    // Order matters
    auto result =
        engine.compare(VH::newSequence(ints({1, 2, 3})), VH::newSequence(ints({1, 3, 2})));
    assert(!result && (result.failure_points.size() == 1));
    auto const& fp = result.failure_points.at(0);
    assert((fp.position == 1) && fp.expected_has_data && fp.actual_has_data);
    assert(fp.expected_value.getIntValue() == 2);
    assert(fp.actual_value.getIntValue() == 3);

    // Extra element on the left
    result = engine.compare(VH::newSequence(ints({1, 2, 3})), VH::newSequence(ints({1, 2})));
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).position == 2);
    assert(!result.failure_points.at(0).actual_has_data);
    assert(result.failure_points.at(0).unparse() == "at index 2: expected 3 but was <none>");

    // Extra element on the right
    result = engine.compare(VH::newSequence(), VH::newSequence(ints({7})));
    assert(!result.failure_points.at(0).expected_has_data);
    assert(result.failure_points.at(0).unparse() == "at index 0: expected <none> but was 7");
    std::cout << "sequences done" << std::endl;
}

static void
test_arrays()
{
    EqualityComparer engine;
    auto m1 = VH::newArray({2, 3}, ints({1, 2, 3, 4, 5, 6}));
    auto m2 = VH::newArray({2, 3}, ints({1, 2, 3, 4, 0, 6}));
    assert(engine.areEqual(m1, VH::newArray({2, 3}, ints({1, 2, 3, 4, 5, 6}))));

    auto result = engine.compare(m1, m2);
    assert(!result && (result.failure_points.size() == 1));
    auto const& fp = result.failure_points.at(0);
    assert(fp.position == 4);
    assert(fp.indices == (std::vector<size_t>{1, 1}));
    assert(fp.unparse() == "at index [1,1]: expected 5 but was 0");

    // Same elements, different shape
    auto m3 = VH::newArray({3, 2}, ints({1, 2, 3, 4, 5, 6}));
    auto flat = VH::newArray(ints({1, 2, 3, 4, 5, 6}));
    result = engine.compare(m1, m3);
    assert(!result && result.failure_points.empty());
    assert(!engine.areEqual(m1, flat));
    assert(!engine.areEqual(m1, VH::newSequence(ints({1, 2, 3, 4, 5, 6}))));
    assert(!engine.areEqual(VH::newSequence(ints({1, 2, 3, 4, 5, 6})), m1));

    // A different first dimension shows up as a missing row
    auto m4 = VH::newArray({1, 3}, ints({1, 2, 3}));
    result = engine.compare(m1, m4);
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).indices == (std::vector<size_t>{1, 0}));
    assert(!result.failure_points.at(0).actual_has_data);

    // A one-dimensional array equals a sequence with the same elements
    assert(engine.areEqual(flat, VH::newSequence(ints({1, 2, 3, 4, 5, 6}))));
    assert(engine.areEqual(VH::newSequence(ints({1, 2})), VH::newArray(ints({1, 2}))));

    // In collection mode only the elements in row-major order matter
    engine.setCompareAsCollection(true);
    assert(engine.getCompareAsCollection());
    assert(engine.areEqual(m1, m3));
    assert(engine.areEqual(m1, flat));
    assert(engine.areEqual(m3, VH::newSequence(ints({1, 2, 3, 4, 5, 6}))));
    result = engine.compare(m1, m2);
    assert(result.failure_points.at(0).indices.empty());
    assert(result.failure_points.at(0).unparse() == "at index 4: expected 5 but was 0");
    std::cout << "arrays done" << std::endl;
}

static void
test_dictionaries()
{
    EqualityComparer engine;
    auto a = VH::newString("a");
    auto b = VH::newString("b");
    auto d1 = VH::newDictionary({{a, VH::newInteger(1)}, {b, VH::newInteger(2)}});
    auto d2 = VH::newDictionary({{VH::newString("b"), VH::newInteger(2)},
                                 {VH::newString("a"), VH::newInteger(1)}});
    // Order of entries doesn't matter
    assert(engine.areEqual(d1, d2));
    assert(engine.areEqual(d2, d1));

    auto d3 = VH::newDictionary({{a, VH::newInteger(1)}, {b, VH::newInteger(3)}});
    auto result = engine.compare(d1, d3);
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).key.getStringValue() == "b");
    assert(result.failure_points.at(0).unparse() == "at key \"b\": expected 2 but was 3");

    auto d4 = VH::newDictionary({{a, VH::newInteger(1)}, {VH::newString("c"), VH::newInteger(2)}});
    result = engine.compare(d1, d4);
    assert(result.failure_points.size() == 1);
    assert(result.failure_points.at(0).unparse() == "at key \"b\": expected 2 but was <none>");
    assert(!result.failure_points.at(0).actual_has_data);

    // Different sizes
    result = engine.compare(d1, VH::newDictionary({{a, VH::newInteger(1)}}));
    assert(!result && result.failure_points.empty());

    // Keys are exact even when the values use a tolerance
    auto r1 = VH::newDictionary({{VH::newReal(1.0), VH::newReal(10.0)}});
    auto r2 = VH::newDictionary({{VH::newReal(1.05), VH::newReal(10.05)}});
    auto r3 = VH::newDictionary({{VH::newReal(1.0), VH::newReal(10.05)}});
    assert(!engine.areEqual(r1, r2, Tolerance::linear(0.1)));
    assert(engine.areEqual(r1, r3, Tolerance::linear(0.1)));

    // Keys are compared deeply, and each entry is matched once
    auto k1 = VH::newDictionary({{VH::newSequence(ints({1})), a},
                                 {VH::newSequence(ints({2})), b}});
    auto k2 = VH::newDictionary({{VH::newSequence(ints({2})), b},
                                 {VH::newSequence(ints({1})), a}});
    assert(engine.areEqual(k1, k2));

    // Keys the engine considers equal are still distinct entries
    auto mixed1 = VH::newDictionary(
        {{VH::newInteger(1), VH::newString("a")}, {VH::newReal(1.0), VH::newString("b")}});
    auto mixed2 = VH::newDictionary(
        {{VH::newReal(1.0), VH::newString("b")}, {VH::newInteger(1), VH::newString("a")}});
    assert(mixed1.getItemCount() == 2);
    assert(engine.areEqual(mixed1, mixed2));
    assert(engine.areEqual(mixed2, mixed1));
    auto mixed3 = VH::newDictionary(
        {{VH::newReal(1.0), VH::newString("b")}, {VH::newInteger(1), VH::newString("c")}});
    result = engine.compare(mixed1, mixed3);
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).unparse() == "at key 1: expected \"a\" but was \"c\"");

    EqualityComparer nocase;
    nocase.setIgnoreCase(true);
    auto upper_a = VH::newString("A");
    auto cased1 = VH::newDictionary({{a, VH::newInteger(1)}, {upper_a, VH::newInteger(2)}});
    auto cased2 = VH::newDictionary({{upper_a, VH::newInteger(2)}, {a, VH::newInteger(1)}});
    assert(nocase.areEqual(cased1, cased2));
    assert(nocase.areEqual(cased2, cased1));
    assert(nocase.areEqual(cased1, cased1));

    // Without an exact key, every key equal under the engine is tried
    auto upper = VH::newDictionary(
        {{VH::newString("B"), VH::newInteger(2)}, {a, VH::newInteger(1)}});
    auto lower = VH::newDictionary(
        {{VH::newString("b"), VH::newInteger(2)}, {upper_a, VH::newInteger(1)}});
    assert(nocase.areEqual(upper, lower));
    auto shared_case = VH::newDictionary(
        {{VH::newString("X"), VH::newInteger(1)}, {VH::newString("Y"), VH::newInteger(2)}});
    auto other_case = VH::newDictionary(
        {{VH::newString("y"), VH::newInteger(1)}, {VH::newString("x"), VH::newInteger(2)}});
    result = nocase.compare(shared_case, other_case);
    assert(!result && (result.failure_points.size() == 1));
    assert(result.failure_points.at(0).unparse() == "at key \"X\": expected 1 but was 2");

    // Nested failure trail
    auto n1 = VH::newDictionary({{a, VH::newSequence(ints({1, 2}))}});
    auto n2 = VH::newDictionary({{a, VH::newSequence(ints({1, 5}))}});
    result = engine.compare(n1, n2);
    assert(result.failure_points.size() == 2);
    assert(result.failure_points.at(0).unparse() == "at key \"a\": expected [1, 2] but was [1, 5]");
    assert(result.failure_points.at(1).unparse() == "at index 1: expected 2 but was 5");

    // A dictionary iterates as pairs, so it equals a sequence of matching pairs
    auto pairs = VH::newSequence(
        {VH::newPair(a, VH::newInteger(1)), VH::newPair(b, VH::newInteger(2))});
    assert(engine.areEqual(d1, pairs));
    std::cout << "dictionaries done" << std::endl;
}

static void
test_pairs_and_tuples()
{
    EqualityComparer engine;
    auto p1 = VH::newPair(VH::newString("x"), VH::newReal(1.0));
    auto p2 = VH::newPair(VH::newString("x"), VH::newReal(1.05));
    auto p3 = VH::newPair(VH::newReal(1.0), VH::newString("x"));
    auto p4 = VH::newPair(VH::newReal(1.05), VH::newString("x"));
    assert(!engine.areEqual(p1, p2));
    assert(engine.areEqual(p1, p2, Tolerance::linear(0.1)));
    // The key is always exact
    assert(!engine.areEqual(p3, p4, Tolerance::linear(0.1)));
    assert(engine.compare(p3, p4, Tolerance::linear(0.1)).failure_points.empty());
    auto r = engine.compare(p1, p2);
    assert(r.failure_points.size() == 1);
    assert(r.failure_points.at(0).unparse() == "at key \"x\": expected 1 but was 1.05");

    auto t1 = VH::newTuple({VH::newInteger(1), VH::newString("a"), VH::newSequence(ints({2}))});
    auto t2 = VH::newTuple({VH::newInteger(1), VH::newString("a"), VH::newSequence(ints({2}))});
    auto t3 = VH::newTuple({VH::newInteger(1), VH::newString("b"), VH::newSequence(ints({2}))});
    assert(engine.areEqual(t1, t2));
    assert(!engine.areEqual(t1, t3));
    r = engine.compare(t1, t3);
    assert(r.failure_points.size() == 1);
    assert(r.failure_points.at(0).unparse() == "at index 1: expected \"a\" but was \"b\"");
    // One failure point per level of nesting
    auto t5 = VH::newTuple({VH::newInteger(1), VH::newString("a"), VH::newSequence(ints({3}))});
    r = engine.compare(t1, t5);
    assert(r.failure_points.size() == 2);
    assert(r.failure_points.at(0).position == 2);
    assert(r.failure_points.at(1).unparse() == "at index 0: expected 2 but was 3");
    auto nested1 = VH::newSequence({p1});
    auto nested2 = VH::newSequence({p2});
    r = engine.compare(nested1, nested2);
    assert(r.failure_points.size() == 2);
    assert(r.failure_points.at(0).position == 0);
    assert(r.failure_points.at(1).key.getStringValue() == "x");
    // Different arity falls back to identity
    auto t4 = VH::newTuple({VH::newInteger(1), VH::newString("a")});
    assert(!engine.areEqual(t1, t4));
    assert(engine.areEqual(t4, t4));
    assert(engine.areEqual(VH::newTuple({}), VH::newTuple({})));
    // Tuples are not sequences
    assert(!engine.areEqual(VH::newTuple(ints({1})), VH::newSequence(ints({1}))));
    std::cout << "pairs and tuples done" << std::endl;
}

int
main()
{
    test_sequences();
    test_arrays();
    test_dictionaries();
    test_pairs_and_tuples();
    std::cout << "collections: all tests passed" << std::endl;
    return 0;
}
