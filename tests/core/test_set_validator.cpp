#undef NDEBUG
#include <cassert>
#include <iostream>

#include "rummi/core/SetValidator.hpp"

using namespace rummi::core;

namespace {

int g_next_id = 0;

Tile N(TileColor color, int number) {
    return Tile::Numbered("t" + std::to_string(g_next_id++), color, number);
}

Tile J() {
    return Tile::Joker("j" + std::to_string(g_next_id++));
}

constexpr TileColor R = TileColor::Red;
constexpr TileColor B = TileColor::Blue;
constexpr TileColor Y = TileColor::Yellow;
constexpr TileColor K = TileColor::Black;

void TestGroups() {
    assert(IsValidGroup({N(R, 5), N(B, 5), N(Y, 5)}));
    assert(IsValidGroup({N(R, 5), N(B, 5), N(Y, 5), N(K, 5)}));
    assert(IsValidGroup({J(), N(Y, 13), N(B, 13)}));
    assert(!IsValidGroup({N(R, 5), N(B, 5)}));
    assert(!IsValidGroup({N(R, 5), N(R, 5), N(Y, 5)}));
    assert(!IsValidGroup({N(R, 5), N(B, 6), N(Y, 5)}));
    assert(!IsValidGroup({N(R, 5), N(B, 5), N(Y, 5), N(K, 5), J()}));
    // Three colors used leaves room for one joker only.
    assert(IsValidGroup({N(R, 9), N(B, 9), N(Y, 9), J()}));
    assert(IsValidGroup({N(R, 9), N(B, 9), J(), J()}));
    assert(IsValidGroup({J(), J(), J()}));
}

void TestRuns() {
    assert(IsValidRun({N(R, 1), N(R, 2), N(R, 3)}));
    assert(!IsValidRun({N(R, 1), N(R, 2), N(R, 4)}));
    assert(IsValidRun({N(R, 1), J(), N(R, 3)}));
    assert(IsValidRun({N(B, 3), N(B, 1), N(B, 2)}));
    assert(!IsValidRun({N(R, 1), N(B, 2), N(R, 3)}));
    assert(!IsValidRun({N(R, 4), N(R, 4), N(R, 5)}));
    assert(IsValidRun({N(K, 12), N(K, 13), J()}));
    assert(IsValidRun({J(), J(), N(Y, 1)}));
    assert(!IsValidRun({N(R, 1), N(R, 2)}));
    assert(IsValidRun({J(), J(), J()}));

    TileSet full;
    for (int number = 1; number <= 13; ++number) {
        full.push_back(N(Y, number));
    }
    assert(IsValidRun(full));
    full.push_back(J());
    assert(!IsValidRun(full));
}

void TestWindowAndValue() {
    assert(RunWindowStart({N(R, 5), J(), N(R, 7)}) == 5);
    // Joker after 12-13 can only sit below them.
    assert(RunWindowStart({N(K, 12), N(K, 13), J()}) == 11);
    assert(SetValue({N(K, 12), N(K, 13), J()}) == 36);
    assert(SetValue({J(), N(Y, 13), N(B, 13)}) == 39);
    assert(SetValue({N(R, 1), N(R, 2), N(R, 3)}) == 6);
    assert(SetValue({J(), J(), J()}) == 0);
    assert(SetValue({N(R, 1), N(B, 2), N(Y, 3)}) == 0);
}

void TestClassificationIsDeterministic() {
    const TileSet group{N(R, 8), N(B, 8), J()};
    const TileSet run{N(R, 8), N(R, 9), J()};
    for (int i = 0; i < 3; ++i) {
        assert(ClassifySet(group) == SetKind::Group);
        assert(ClassifySet(run) == SetKind::Run);
        assert(ClassifySet({N(R, 1), N(B, 2), N(Y, 9)}) == SetKind::Invalid);
    }
    assert(IsValidBoard({group, run}));
    assert(!IsValidBoard({group, {N(R, 1), N(B, 2), N(Y, 9)}}));
}

}  // namespace

int main() {
    TestGroups();
    TestRuns();
    TestWindowAndValue();
    TestClassificationIsDeterministic();
    std::cout << "All set validator tests passed." << std::endl;
    return 0;
}
