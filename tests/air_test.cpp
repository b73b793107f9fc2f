#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <sstream>

#include "test_util.hpp"

using namespace semaphore;
using namespace semaphore::test_util;

namespace {

const char* TOPIC = "The Winter is Coming...";

struct Fixture {
    Group group;
    AccessSet set;
    Digest topic_hash;

    explicit Fixture(size_t members)
        : group(members), set(group.pubs, quiet_params()), topic_hash(rescue::hash_bytes(TOPIC)) {}

    TraceTable honest_trace(size_t i, const Params& prm = quiet_params(), const uint8_t* seed = nullptr) const {
        SemaphoreProver prover(set.depth(), prm);
        return prover.build_trace(group.keys[i], set.path_for(i), i, topic_hash, seed);
    }

    air::SemaphoreAir air_for(const TraceTable& t) const {
        return air::SemaphoreAir(set.depth(), claimed_inputs(t, set.root(), topic_hash));
    }
};

}

TEST(AirTest, HonestTraceSatisfiesEveryConstraint) {
    for (size_t members : {2, 4, 5, 8, 16}) {
        Fixture fx(members);
        for (size_t i = 0; i < members; i += 3) {
            auto t = fx.honest_trace(i);
            auto a = fx.air_for(t);
            auto v = a.find_violation(t);
            EXPECT_FALSE(v.has_value()) << members << " members, signer " << i << ", slot "
                                        << (v ? a.registry()[*v].label : std::string());
            EXPECT_TRUE(a.verify(t));
        }
    }
}

TEST(AirTest, TraceLayout) {
    Fixture fx(8);
    const size_t i = 3;
    auto t = fx.honest_trace(i);
    const PrivKey& sk = fx.group.keys[i];

    ASSERT_EQ(t.width(), TRACE_WIDTH);
    ASSERT_EQ(t.length(), 32u);

    for (size_t j = 0; j < DIGEST_WIDTH; j++) {
        EXPECT_EQ(t.at(0, col::MERKLE_LO + j), sk.el[j]);
        EXPECT_EQ(t.at(0, col::MERKLE_HI + j), fp_zero());
        EXPECT_EQ(t.at(0, col::NULLIFIER_LO + j), sk.el[j]);
        EXPECT_EQ(t.at(0, col::TOPIC + j), fx.topic_hash[j]);
    }
    EXPECT_EQ(t.at(0, col::MERKLE_CAP), Fp{4});
    EXPECT_EQ(t.at(0, col::NULLIFIER_CAP), Fp{8});
    EXPECT_EQ(t.at(0, col::NULLIFIER_CAP + 1), Fp{1});

    // cycle 0 output is the member's public key, carried into cycle 1
    for (size_t j = 0; j < DIGEST_WIDTH; j++) {
        EXPECT_EQ(t.at(7, col::MERKLE_LO + j), fx.group.pubs[i].el[j]);
        EXPECT_EQ(t.at(8, col::MERKLE_CAP + j), domain_capacity(Domain::MERKLE)[j]);
    }

    Digest nul = rescue::nullifier(sk.el, fx.topic_hash);
    size_t root_row = root_row_for_depth(fx.set.depth());
    EXPECT_EQ(root_row, 31u);
    for (size_t j = 0; j < DIGEST_WIDTH; j++) {
        EXPECT_EQ(t.at(7, col::NULLIFIER_LO + j), nul[j]);
        EXPECT_EQ(t.at(root_row, col::MERKLE_LO + j), fx.set.root()[j]);
    }

    // leaf 3 = 0b011
    for (size_t row = 0; row < t.length(); row++) {
        size_t cycle = row / CYCLE_LENGTH;
        bool bit = cycle >= 1 && cycle <= 3 && ((i >> (cycle - 1)) & 1);
        EXPECT_EQ(t.at(row, col::INDEX_BIT), fp_from_bool(bit)) << "row " << row;
    }

    // nullifier lane restarts from the zero state after cycle 0
    for (size_t row = CYCLE_LENGTH; row < t.length(); row += CYCLE_LENGTH)
        for (size_t c = col::NULLIFIER; c < col::NULLIFIER + STATE_WIDTH; c++)
            EXPECT_EQ(t.at(row, c), fp_zero());
}

TEST(AirTest, PaddingCyclesCarryTheRoot) {
    // depth 2: three live cycles padded to four
    Fixture fx(4);
    ASSERT_EQ(fx.set.depth(), 2u);
    auto t = fx.honest_trace(2);
    EXPECT_EQ(t.length(), 32u);

    size_t root_row = root_row_for_depth(2);
    EXPECT_EQ(root_row, 23u);
    Digest root;
    for (size_t j = 0; j < DIGEST_WIDTH; j++) root[j] = t.at(root_row, col::MERKLE_LO + j);
    EXPECT_TRUE(digest_eq(root, fx.set.root()));

    for (size_t j = 0; j < DIGEST_WIDTH; j++) {
        EXPECT_EQ(t.at(24, col::MERKLE_LO + j), root[j]);
        EXPECT_EQ(t.at(24, col::MERKLE_HI + j), fp_zero());
    }
    EXPECT_EQ(t.at(24, col::INDEX_BIT), fp_zero());
    EXPECT_TRUE(fx.air_for(t).verify(t));
}

TEST(AirTest, RandomizedPaddingStillVerifies) {
    Fixture fx(8);
    Params prm = quiet_params();
    prm.randomize_padding = true;

    uint8_t s1[32] = {1};
    uint8_t s2[32] = {2};
    auto t1 = fx.honest_trace(5, prm, s1);
    auto t2 = fx.honest_trace(5, prm, s2);

    EXPECT_NE(t1.at(CYCLE_LENGTH, col::NULLIFIER), t2.at(CYCLE_LENGTH, col::NULLIFIER));
    for (size_t j = 0; j < DIGEST_WIDTH; j++)
        EXPECT_EQ(t1.at(7, col::NULLIFIER_LO + j), t2.at(7, col::NULLIFIER_LO + j));

    EXPECT_TRUE(fx.air_for(t1).verify(t1));
    EXPECT_TRUE(fx.air_for(t2).verify(t2));

    auto again = fx.honest_trace(5, prm, s1);
    EXPECT_EQ(again.cells().size(), t1.cells().size());
    for (size_t k = 0; k < again.cells().size(); k++)
        ASSERT_EQ(again.cells()[k], t1.cells()[k]) << "cell " << k;
}

TEST(AirTest, ConstraintSlotsAreUnique) {
    Fixture fx(8);
    auto t = fx.honest_trace(0);
    auto a = fx.air_for(t);
    const auto& reg = a.registry();

    std::set<size_t> slots;
    std::set<std::string> labels;
    for (size_t s = 0; s < reg.size(); s++) {
        EXPECT_EQ(reg[s].slot, s);
        slots.insert(reg[s].slot);
        labels.insert(reg[s].label);
    }
    EXPECT_EQ(slots.size(), reg.size());
    EXPECT_EQ(labels.size(), reg.size());

    // 2 lanes x 12 round slots, 2 index bit slots, 8 selection slots, 4 binding slots
    EXPECT_EQ(reg.count(air::ConstraintKind::TRANSITION), 38u);
    // capacity x3, key padding, topic, root, nullifier: 7 words of 4
    EXPECT_EQ(reg.count(air::ConstraintKind::BOUNDARY), 28u);
    EXPECT_EQ(a.num_constraints(), 66u);
    EXPECT_EQ(reg.max_degree(air::ConstraintKind::TRANSITION), (uint32_t)ALPHA);

    std::set<size_t> assertion_slots;
    for (const auto& as : a.assertions()) {
        EXPECT_EQ(reg[as.id.slot].kind, air::ConstraintKind::BOUNDARY);
        assertion_slots.insert(as.id.slot);
    }
    EXPECT_EQ(assertion_slots.size(), a.assertions().size());
    EXPECT_EQ(a.assertions().size(), 28u);
}

// nudging the cell an assertion pins must light up that assertion's own slot
TEST(AirTest, EveryAssertionOwnsItsSlot) {
    Fixture fx(8);
    auto t = fx.honest_trace(6);
    auto a = fx.air_for(t);

    for (const auto& as : a.assertions()) {
        size_t row = as.first_row;
        TraceTable bad = t;
        bad.at(row, as.column) = fp_add(bad.at(row, as.column), fp_one());

        auto values = a.evaluate_row(bad, row);
        EXPECT_FALSE(fp_is_zero(values[as.id.slot])) << a.registry()[as.id.slot].label;
        for (const auto& other : a.assertions()) {
            if (other.id.slot == as.id.slot || !other.applies_to(row)) continue;
            if (other.column == as.column) continue;
            EXPECT_TRUE(fp_is_zero(values[other.id.slot])) << a.registry()[other.id.slot].label;
        }
        EXPECT_FALSE(a.verify(bad));
    }
}

TEST(AirTest, PeriodicColumns) {
    Fixture fx(8);
    auto t = fx.honest_trace(0);
    auto a = fx.air_for(t);
    const auto& tb = rescue::tables();

    for (size_t row = 0; row < a.trace_length(); row++) {
        auto pv = a.periodic_values(row);
        size_t step = row % CYCLE_LENGTH;
        EXPECT_EQ(pv.hash_mask, fp_from_bool(step != NUM_ROUNDS));
        EXPECT_EQ(pv.first_row, fp_from_bool(row == 0));
        if (step < NUM_ROUNDS) {
            EXPECT_EQ(pv.ark1[0], tb.ark1[step][0]);
            EXPECT_EQ(pv.ark2[11], tb.ark2[step][11]);
        } else {
            EXPECT_EQ(pv.ark1[0], fp_zero());
        }
    }
}

TEST(AirTest, MerkleCapacityIsPinnedOnEveryCycle) {
    Fixture fx(8);
    auto t = fx.honest_trace(1);
    auto a = fx.air_for(t);

    size_t hits = 0;
    for (const auto& as : a.assertions()) {
        if (a.registry()[as.id.slot].label.rfind("merkle.capacity", 0) != 0) continue;
        EXPECT_EQ(as.stride, CYCLE_LENGTH);
        for (size_t row = 0; row < a.trace_length(); row++)
            if (as.applies_to(row)) hits++;
    }
    // 4 words on rows 8, 16, 24
    EXPECT_EQ(hits, 12u);
}

TEST(AirTest, RejectsWrongShape) {
    Fixture fx(8);
    auto t = fx.honest_trace(0);
    auto a = fx.air_for(t);

    TraceTable narrow(TRACE_WIDTH - 1, t.length());
    TraceTable shortened(TRACE_WIDTH, t.length() / 2);
    EXPECT_FALSE(a.verify(narrow));
    EXPECT_FALSE(a.verify(shortened));
    auto v = a.find_violation(shortened);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, a.num_constraints());
}

TEST(AirTest, PublicInputsMustMatch) {
    Fixture fx(8);
    auto t = fx.honest_trace(4);
    auto pub = claimed_inputs(t, fx.set.root(), fx.topic_hash);

    auto wrong_nullifier = pub;
    wrong_nullifier.nullifier[2] = fp_add(wrong_nullifier.nullifier[2], fp_one());
    air::SemaphoreAir a1(fx.set.depth(), wrong_nullifier);
    auto v1 = a1.find_violation(t);
    ASSERT_TRUE(v1.has_value());
    EXPECT_TRUE(label_starts_with(a1, *v1, "nullifier.output"));

    auto wrong_topic = pub;
    wrong_topic.topic_hash = rescue::hash_bytes("another topic");
    air::SemaphoreAir a2(fx.set.depth(), wrong_topic);
    auto v2 = a2.find_violation(t);
    ASSERT_TRUE(v2.has_value());
    EXPECT_TRUE(label_starts_with(a2, *v2, "nullifier.topic"));

    auto wrong_root = pub;
    wrong_root.root = fx.group.pubs[0].el;
    air::SemaphoreAir a3(fx.set.depth(), wrong_root);
    auto v3 = a3.find_violation(t);
    ASSERT_TRUE(v3.has_value());
    EXPECT_TRUE(label_starts_with(a3, *v3, "merkle.root"));
}

TEST(AirTest, WitnessErrors) {
    Fixture fx(8);
    SemaphoreProver prover(fx.set.depth(), quiet_params());
    const PrivKey& sk = fx.group.keys[2];
    auto path = fx.set.path_for(2);

    auto expect_code = [&](WitnessErrc code, const PrivKey& key, const MerklePath& p, size_t index) {
        try {
            prover.build_trace(key, p, index, fx.topic_hash);
            ADD_FAILURE() << "expected " << witness_errc_name(code);
        } catch (const WitnessError& e) {
            EXPECT_EQ(e.code(), code) << e.what();
        }
    };

    MerklePath shorter(path.begin(), path.end() - 1);
    expect_code(WitnessErrc::WITNESS_LENGTH_MISMATCH, sk, shorter, 2);
    expect_code(WitnessErrc::INDEX_OUT_OF_RANGE, sk, path, 8);
    expect_code(WitnessErrc::PATH_INDEX_MISMATCH, sk, path, 3);

    PrivKey bad = sk;
    bad.el[1] = Fp{P};
    expect_code(WitnessErrc::NON_CANONICAL, bad, path, 2);

    MerklePath bad_sibling = path;
    bad_sibling[1].sibling[0] = Fp{P + 1};
    expect_code(WitnessErrc::NON_CANONICAL, sk, bad_sibling, 2);
}

TEST(AirTest, ProverRefusesViolatingTrace) {
    Fixture fx(8);
    SemaphoreProver prover(fx.set.depth(), quiet_params());
    auto t = fx.honest_trace(7);
    auto pub = claimed_inputs(t, fx.set.root(), fx.topic_hash);
    pub.nullifier[0] = fp_add(pub.nullifier[0], fp_one());
    air::SemaphoreAir a(fx.set.depth(), pub);

    try {
        prover.prove(a, t, trace_backend());
        FAIL() << "expected ConstraintViolation";
    } catch (const ConstraintViolation& e) {
        EXPECT_TRUE(label_starts_with(a, e.slot(), "nullifier.output[0]"));
    }
}

TEST(AirTest, PrintTrace) {
    Fixture fx(2);
    auto t = fx.honest_trace(0);
    std::ostringstream os;
    print_trace(os, t, 0, 3, 0, 4);
    std::string out = os.str();

    EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 3);
    // key-derivation capacity word on row 0
    EXPECT_NE(out.find("0000000000000004"), std::string::npos);
}
