#include <deepeq/assert_test.h>

#include <deepeq/EqualityComparer.hh>

#include <iostream>

using namespace deepeq;

typedef ValueHandle VH;

static void
test_strings()
{
    EqualityComparer engine;
    assert(!engine.getIgnoreCase());
    assert(engine.areEqual(VH::newString("hello"), VH::newString("hello")));
    assert(!engine.areEqual(VH::newString("hello"), VH::newString("Hello")));
    assert(!engine.areEqual(VH::newString("hello"), VH::newString("hello ")));
    assert(engine.areEqual(VH::newString(""), VH::newString("")));

    engine.setIgnoreCase(true);
    assert(engine.getIgnoreCase());
    assert(engine.areEqual(VH::newString("hello"), VH::newString("HeLLo")));
    assert(!engine.areEqual(VH::newString("hello"), VH::newString("HeLLo!")));
    // Latin-1, Greek and Cyrillic
    assert(engine.areEqual(VH::newString("caf\xc3\xa9"), VH::newString("CAF\xc3\x89")));
    assert(engine.areEqual(VH::newString("\xce\xb1\xce\xb2"), VH::newString("\xce\x91\xce\x92")));
    assert(engine.areEqual(VH::newString("\xd0\xb4\xd0\xb0"), VH::newString("\xd0\x94\xd0\x90")));
    // Sharp s has no simple upper-case mapping
    assert(!engine.areEqual(VH::newString("stra\xc3\x9f" "e"), VH::newString("STRASSE")));
    // Invalid UTF-8 still compares bytewise around the valid parts
    assert(engine.areEqual(VH::newString("A\xff"), VH::newString("a\xff")));
    assert(!engine.areEqual(VH::newString("A\xff"), VH::newString("a\xfe")));

    // The flag applies to nested strings too
    auto x = VH::newSequence({VH::newString("One"), VH::newString("Two")});
    auto y = VH::newSequence({VH::newString("one"), VH::newString("TWO")});
    assert(engine.areEqual(x, y));
    engine.setIgnoreCase(false);
    auto result = engine.compare(x, y);
    assert(!result.equal);
    assert(result.failure_points.size() == 1);
    assert(result.failure_points.at(0).unparse() == "at index 0: expected \"One\" but was \"one\"");

    // Strings and chars are different types
    assert(!engine.areEqual(VH::newString("a"), VH::newChar('a')));
    std::cout << "strings done" << std::endl;
}

static void
test_chars()
{
    EqualityComparer engine;
    assert(engine.areEqual(VH::newChar('a'), VH::newChar('a')));
    assert(!engine.areEqual(VH::newChar('a'), VH::newChar('A')));
    engine.setIgnoreCase(true);
    assert(engine.areEqual(VH::newChar('a'), VH::newChar('A')));
    assert(engine.areEqual(VH::newChar(0x10c), VH::newChar(0x10d)));
    assert(engine.areEqual(VH::newChar(0x3a9), VH::newChar(0x3c9)));
    assert(!engine.areEqual(VH::newChar('a'), VH::newChar('b')));
    std::cout << "chars done" << std::endl;
}

static void
test_dictionary_keys()
{
    // Keys are located through the engine, so case folding applies to them too
    EqualityComparer engine;
    auto x = VH::newDictionary({{VH::newString("Key"), VH::newInteger(1)}});
    auto y = VH::newDictionary({{VH::newString("KEY"), VH::newInteger(1)}});
    assert(!engine.areEqual(x, y));
    engine.setIgnoreCase(true);
    assert(engine.areEqual(x, y));
    std::cout << "dictionary keys done" << std::endl;
}

int
main()
{
    test_strings();
    test_chars();
    test_dictionary_keys();
    std::cout << "strings: all tests passed" << std::endl;
    return 0;
}
