// Smoke test for the PhyModel behavioral DFI PHY.
//
// Verifies:
//   1. Command decode on {cs_n, act_n, ras_n, cas_n, we_n}.
//   2. Write burst capture with byte masks, read-back through the read pipe.
//   3. Read latency: first rddata_valid is sampled read_latency cycles
//      after the READ command.
//   4. Spacing checker: tRCD, tRP and closed-bank accesses are reported.
//   5. init_start / init_complete handshake.
//   6. Leveling strobes (wrdata_en / rddata_en without a command) are counted.

#include "phy_model.hpp"

#include <cstdio>
#include <vector>

#include "test_assert.hpp"

using namespace ddr_dfi;

// -----------------------------------------------------------------------
// DFI frame builders
// -----------------------------------------------------------------------

static DfiOutputs nop_frame() {
    DfiOutputs f;
    f.cke = 1;
    return f;
}

static DfiOutputs command_frame(
    DfiCommand cmd, uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t address
) {
    DfiOutputs f = nop_frame();
    f.cs_n = chip_select_n(rank);
    f.bank_group = bank_group;
    f.bank = bank;
    f.address = address;
    switch (cmd) {
        case DfiCommand::ACTIVATE:
            f.act_n = 0;
            f.ras_n = 0;
            break;
        case DfiCommand::WRITE:
            f.cas_n = 0;
            f.we_n = 0;
            break;
        case DfiCommand::READ:
            f.cas_n = 0;
            break;
        case DfiCommand::PRECHARGE:
            f.ras_n = 0;
            f.we_n = 0;
            break;
        default:
            break;
    }
    return f;
}

static DfiOutputs write_beat_frame(uint64_t data, uint8_t mask) {
    DfiOutputs f = nop_frame();
    f.wrdata_en = 1;
    f.wrdata = data;
    f.wrdata_mask = mask;
    f.wrdata_cs_n = 0xFE;
    return f;
}

static void idle_cycles(PhyModel& phy, int n) {
    for (int i = 0; i < n; i++) {
        phy.eval(nop_frame());
    }
}

/// Evaluate idle frames until rddata_valid, collecting up to `beats` words.
/// Returns the number of evals between the READ eval and the first valid beat.
static int collect_read(PhyModel& phy, uint32_t beats, std::vector<uint64_t>& words) {
    int first_valid = -1;
    for (int cycle = 1; cycle <= 200 && words.size() < beats; cycle++) {
        phy.eval(nop_frame());
        if (phy.signals().rddata_valid) {
            if (first_valid < 0) {
                first_valid = cycle;
            }
            words.push_back(phy.signals().rddata);
        }
    }
    return first_valid;
}

// -----------------------------------------------------------------------
// Test 1: command decode
// -----------------------------------------------------------------------
static void test_decode(TestResults& results) {
    std::printf("  test_decode...\n");
    TEST_ASSERT_EQ(results, decode_command(DfiOutputs{}), DfiCommand::NOP, "deselected is NOP");
    TEST_ASSERT_EQ(results, decode_command(command_frame(DfiCommand::ACTIVATE, 1, 0, 0, 0)),
                   DfiCommand::ACTIVATE, "ACTIVATE");
    TEST_ASSERT_EQ(results, decode_command(command_frame(DfiCommand::WRITE, 1, 0, 0, 0)),
                   DfiCommand::WRITE, "WRITE");
    TEST_ASSERT_EQ(results, decode_command(command_frame(DfiCommand::READ, 2, 0, 0, 0)),
                   DfiCommand::READ, "READ");
    TEST_ASSERT_EQ(results, decode_command(command_frame(DfiCommand::PRECHARGE, 1, 0, 0, 0)),
                   DfiCommand::PRECHARGE, "PRECHARGE");
    TEST_ASSERT_EQ(results, decode_command(command_frame(DfiCommand::NOP, 1, 0, 0, 0)),
                   DfiCommand::NOP, "selected with no strobes is NOP");

    DfiOutputs refresh = command_frame(DfiCommand::NOP, 1, 0, 0, 0);
    refresh.ras_n = 0;
    refresh.cas_n = 0;
    TEST_ASSERT_EQ(results, decode_command(refresh), DfiCommand::OTHER, "refresh is OTHER");
    std::printf("  test_decode: PASS\n");
}

// -----------------------------------------------------------------------
// Test 2: masked write burst, read-back and read latency
// -----------------------------------------------------------------------
static void test_write_read(TestResults& results) {
    std::printf("  test_write_read...\n");
    PhyConfig cfg;
    PhyModel phy(cfg);
    const TimingConfig& t = cfg.timing;

    // Pre-load the second column so the masked lane has a known value.
    phy.write_word(0, 2, 1, 0x55, 0x21, 0x1111111111111111ULL);

    phy.eval(command_frame(DfiCommand::ACTIVATE, 0x1, 2, 1, 0x55));
    TEST_ASSERT(results, phy.row_open(0, 2, 1), "row opened");
    idle_cycles(phy, static_cast<int>(t.tRCD));

    phy.eval(command_frame(DfiCommand::WRITE, 0x1, 2, 1, 0x20));
    idle_cycles(phy, static_cast<int>(t.tCWL - 1));
    phy.eval(write_beat_frame(0xAAAAAAAAAAAAAAAAULL, 0x00));
    phy.eval(write_beat_frame(0xBBBBBBBBBBBBBBBBULL, 0x01));

    TEST_ASSERT_EQ(results, phy.read_word(0, 2, 1, 0x55, 0x20), uint64_t{0xAAAAAAAAAAAAAAAAULL},
                   "unmasked beat stored");
    TEST_ASSERT_EQ(results, phy.read_word(0, 2, 1, 0x55, 0x21), uint64_t{0xBBBBBBBBBBBBBB11ULL},
                   "byte lane 0 kept under mask");

    idle_cycles(phy, static_cast<int>(t.tWRTP));
    phy.eval(command_frame(DfiCommand::READ, 0x1, 2, 1, 0x20));
    std::vector<uint64_t> words;
    int latency = collect_read(phy, t.beats_per_burst(), words);
    TEST_ASSERT_EQ(results, latency, static_cast<int>(cfg.read_latency) - 1,
                   "first beat driven for the controller's read_latency-th tick");
    TEST_ASSERT_EQ(results, words.size(), size_t{2}, "one beat per cycle for the whole burst");
    if (words.size() == 2) {
        TEST_ASSERT_EQ(results, words[0], uint64_t{0xAAAAAAAAAAAAAAAAULL}, "read beat 0");
        TEST_ASSERT_EQ(results, words[1], uint64_t{0xBBBBBBBBBBBBBB11ULL}, "read beat 1");
    }

    idle_cycles(phy, 2);
    phy.eval(command_frame(DfiCommand::PRECHARGE, 0x1, 2, 1, 0));
    TEST_ASSERT(results, !phy.row_open(0, 2, 1), "row closed");

    TEST_ASSERT(results, phy.violations().empty(), "legal sequence has no violations");
    TEST_ASSERT_EQ(results, phy.activate_count(), uint64_t{1}, "one ACTIVATE");
    TEST_ASSERT_EQ(results, phy.write_count(), uint64_t{1}, "one WRITE");
    TEST_ASSERT_EQ(results, phy.read_count(), uint64_t{1}, "one READ");
    TEST_ASSERT_EQ(results, phy.precharge_count(), uint64_t{1}, "one PRECHARGE");
    std::printf("  test_write_read: PASS\n");
}

// -----------------------------------------------------------------------
// Test 3: spacing and protocol violations
// -----------------------------------------------------------------------
static void test_violations(TestResults& results) {
    std::printf("  test_violations...\n");
    PhyModel phy;

    phy.eval(command_frame(DfiCommand::READ, 0x1, 0, 0, 0));
    TEST_ASSERT_EQ(results, phy.violations().size(), size_t{1}, "READ to a closed bank");

    phy.eval(command_frame(DfiCommand::ACTIVATE, 0x1, 0, 0, 7));
    idle_cycles(phy, 2);
    phy.eval(command_frame(DfiCommand::WRITE, 0x1, 0, 0, 0));
    TEST_ASSERT_EQ(results, phy.violations().size(), size_t{2}, "tRCD violation");

    phy.eval(command_frame(DfiCommand::PRECHARGE, 0x1, 0, 0, 0));
    TEST_ASSERT_EQ(results, phy.violations().size(), size_t{3}, "tWRTP violation");

    phy.eval(command_frame(DfiCommand::ACTIVATE, 0x1, 0, 0, 8));
    // tRP, tRC and same-rank tRRD all violated by an immediate re-activate.
    TEST_ASSERT_EQ(results, phy.violations().size(), size_t{6}, "re-activate spacing violations");

    phy.eval(command_frame(DfiCommand::ACTIVATE, 0x3, 1, 0, 8));
    TEST_ASSERT(results, phy.violations().size() >= 7, "multi-rank select reported");

    phy.reset();
    TEST_ASSERT(results, phy.violations().empty(), "reset clears violations");
    std::printf("  test_violations: PASS\n");
}

// -----------------------------------------------------------------------
// Test 4: init handshake
// -----------------------------------------------------------------------
static void test_init_handshake(TestResults& results) {
    std::printf("  test_init_handshake...\n");
    PhyConfig cfg;
    cfg.auto_init = false;
    cfg.init_latency = 5;
    PhyModel phy(cfg);

    idle_cycles(phy, 20);
    TEST_ASSERT_EQ(results, phy.signals().init_complete, uint8_t{0}, "waits for init_start");

    DfiOutputs start = nop_frame();
    start.init_start = 1;
    phy.eval(start);
    TEST_ASSERT_EQ(results, phy.init_start_count(), uint64_t{1}, "init_start seen");
    idle_cycles(phy, 4);
    TEST_ASSERT_EQ(results, phy.signals().init_complete, uint8_t{0}, "still initializing");
    idle_cycles(phy, 1);
    TEST_ASSERT_EQ(results, phy.signals().init_complete, uint8_t{1}, "init_complete after latency");

    PhyModel auto_phy;
    idle_cycles(auto_phy, static_cast<int>(PhyConfig{}.init_latency));
    TEST_ASSERT_EQ(results, auto_phy.signals().init_complete, uint8_t{1}, "auto init after reset");
    std::printf("  test_init_handshake: PASS\n");
}

// -----------------------------------------------------------------------
// Test 5: leveling strobes and memory persistence across reset
// -----------------------------------------------------------------------
static void test_leveling_and_reset(TestResults& results) {
    std::printf("  test_leveling_and_reset...\n");
    PhyModel phy;
    phy.write_word(1, 0, 3, 9, 4, 0xDEADBEEFULL);

    for (int i = 0; i < 4; i++) {
        phy.eval(write_beat_frame(0xAAAA5555AAAA5555ULL, 0));
        DfiOutputs rd = nop_frame();
        rd.rddata_en = 1;
        phy.eval(rd);
    }
    TEST_ASSERT_EQ(results, phy.write_level_strobes(), uint64_t{4}, "write leveling strobes");
    TEST_ASSERT_EQ(results, phy.read_level_strobes(), uint64_t{4}, "read leveling strobes");
    TEST_ASSERT_EQ(results, phy.read_word(0, 0, 0, 0, 0), uint64_t{0}, "leveling stores nothing");

    phy.reset();
    TEST_ASSERT_EQ(results, phy.read_word(1, 0, 3, 9, 4), uint64_t{0xDEADBEEFULL},
                   "memory survives reset");
    std::printf("  test_leveling_and_reset: PASS\n");
}

int main() {
    std::printf("Running PhyModel smoke tests...\n\n");

    TestResults results;

    test_decode(results);
    test_write_read(results);
    test_violations(results);
    test_init_handshake(results);
    test_leveling_and_reset(results);

    return test_summary(results);
}
