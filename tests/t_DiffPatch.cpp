// Diff / patch tests. Uses the non-fatal CHECK counter so one run reports
// every mismatch.

#include <iostream>
#include <vector>

#include "VirtualMemory.hpp"

using vmem::Changeset;
using vmem::VirtualMemory;
using vmem::Word;
using Bytes = std::vector<std::uint8_t>;

static int g_checks=0, g_fails=0;
static void CHECK(bool cond, const char* expr){ ++g_checks; if(!cond){ ++g_fails; std::cout<<"[FAIL] "<<expr<<"\n"; } }

static const Bytes kData = {
    0x01, 0x02, 0x03, 0x04,
    0x01, 0x02, 0x03, 0x04,
    0x05,
};

static void test_diff_reports_new_words(){
    std::cout << "[Case] diff reports new words\n";
    VirtualMemory<4> oldMem(8);
    oldMem.write_at(kData, 0x02);
    VirtualMemory<4> newMem(8);
    newMem.write_at(kData, 0x02);
    newMem.write_at(kData, 0x06);

    auto patch = VirtualMemory<4>::diff(oldMem, newMem);
    Changeset<4> expected;
    expected[0x06] = {0x01, 0x02, 0x03, 0x04};
    expected[0x07] = {0x01, 0x02, 0x03, 0x04};
    CHECK(patch == expected, "diff == {6,7}");
}

static void test_diff_is_minimal(){
    std::cout << "[Case] diff is minimal\n";
    VirtualMemory<4> oldMem(16), newMem(16);
    oldMem.write_word({1, 1, 1, 1}, 1);
    oldMem.write_word({2, 2, 2, 2}, 5);
    oldMem.write_word({3, 3, 3, 3}, 9);
    newMem.write_word({1, 1, 1, 1}, 1);   // same
    newMem.write_word({2, 2, 2, 9}, 5);   // changed
    newMem.write_word({0, 0, 0, 0}, 12);  // stored zero equals absent zero
    newMem.write_word({4, 4, 4, 4}, 15);  // added

    auto patch = VirtualMemory<4>::diff(oldMem, newMem);
    CHECK(patch.size() == 3, "three differing addresses");
    CHECK(patch.count(5) == 1 && patch.at(5) == (Word<4>{2, 2, 2, 9}), "changed word recorded");
    CHECK(patch.count(9) == 1 && patch.at(9) == (Word<4>{}), "cleared word recorded as zero");
    CHECK(patch.count(15) == 1 && patch.at(15) == (Word<4>{4, 4, 4, 4}), "added word recorded");
    CHECK(patch.count(1) == 0 && patch.count(12) == 0, "equal words omitted");

    CHECK(VirtualMemory<4>::diff(newMem, newMem).empty(), "self diff is empty");
}

static void test_diff_uses_shorter_length(){
    std::cout << "[Case] diff over shorter length\n";
    VirtualMemory<4> shortMem(4), longMem(8);
    longMem.write_word({7, 7, 7, 7}, 2);
    longMem.write_word({7, 7, 7, 7}, 6);

    auto a = VirtualMemory<4>::diff(shortMem, longMem);
    CHECK(a.size() == 1 && a.count(2) == 1, "only addresses below 4 compared");
    auto b = VirtualMemory<4>::diff(longMem, shortMem);
    CHECK(b.size() == 1 && b.at(2) == (Word<4>{}), "reverse diff records zero");
}

static void test_patch_agrees_with_diff(){
    std::cout << "[Case] patch(diff) reproduces new\n";
    VirtualMemory<4> oldMem(32), newMem(32);
    oldMem.write_at(kData, 0);
    oldMem.write_word({9, 9, 9, 9}, 20);
    newMem.write_at(kData, 10);
    newMem.write_word({9, 9, 9, 8}, 20);
    newMem.write_word({5, 5, 5, 5}, 31);

    VirtualMemory<4> target = oldMem;
    target.patch(VirtualMemory<4>::diff(oldMem, newMem));
    CHECK(target.logically_equals(newMem), "patched copy matches new");
    CHECK(VirtualMemory<4>::diff(target, newMem).empty(), "no remaining diff");
    CHECK(!oldMem.logically_equals(newMem), "source memory left alone");
}

static void test_patch_is_not_atomic(){
    std::cout << "[Case] patch stops at first bad address\n";
    VirtualMemory<4> target(4);
    Changeset<4> changes;
    changes[1] = {1, 1, 1, 1};
    changes[3] = {3, 3, 3, 3};
    changes[6] = {6, 6, 6, 6};
    changes[9] = {9, 9, 9, 9};

    bool threw = false;
    try {
        target.patch(changes);
    } catch (const vmem::AddressOutOfBounds& e) {
        threw = true;
        CHECK(e.address() == 6, "first failing address reported");
    }
    CHECK(threw, "patch throws AddressOutOfBounds");
    CHECK(target.stored_words() == 2, "earlier writes stay committed");
    CHECK(*target.read_word(1) == (Word<4>{1, 1, 1, 1}), "word 1 written");
    CHECK(*target.read_word(3) == (Word<4>{3, 3, 3, 3}), "word 3 written");
}

static void test_empty_patch(){
    std::cout << "[Case] empty patch\n";
    VirtualMemory<4> target(4);
    target.patch(Changeset<4>{});
    CHECK(target.stored_words() == 0, "nothing stored");
}

int main(){
    test_diff_reports_new_words();
    test_diff_is_minimal();
    test_diff_uses_shorter_length();
    test_patch_agrees_with_diff();
    test_patch_is_not_atomic();
    test_empty_patch();
    std::cout << "Checks: " << g_checks << ", Fails: " << g_fails << "\n";
    return g_fails == 0 ? 0 : 1;
}
