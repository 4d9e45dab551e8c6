// Behavioral DFI PHY + DRAM model used by the simulator, the scenario
// harness and the integration tests.
//
// The model sits on the far side of the DFI boundary. Once per clock cycle
// it samples the controller's DfiOutputs frame and:
//   - Decodes the command on {cs_n, act_n, ras_n, cas_n, we_n}.
//   - Tracks the open row of every (rank, bank group, bank).
//   - Stores write beats qualified by wrdata_en, honoring wrdata_mask.
//   - Returns read beats on rddata/rddata_valid `read_latency` cycles after
//     a READ command, one beat per cycle.
//   - Raises init_complete `init_latency` cycles after reset (auto_init) or
//     after an init_start pulse.
//   - Checks the JEDEC minimum spacing between commands and records every
//     violation.
//
// This model is not part of the controller. It only stands in for the
// external PHY so the controller's waveforms can be exercised end to end.
//
// Memory is stored sparsely using an unordered_map keyed by the decoded
// (rank, bank group, bank, row, column) location.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dfi_signals.hpp"
#include "timing_config.hpp"

namespace ddr_dfi {

/// Commands decoded from the DFI command bus.
enum class DfiCommand : uint8_t {
    NOP,
    ACTIVATE,
    READ,
    WRITE,
    PRECHARGE,
    OTHER, ///< Refresh, mode register, ZQ: not modeled
};

const char* to_string(DfiCommand cmd);

/// Decode the command on the DFI bus. Returns NOP when no rank is selected.
DfiCommand decode_command(const DfiOutputs& dfi);

struct PhyConfig {
    /// Timing the spacing checker enforces.
    TimingConfig timing;
    /// Cycles from the READ command to the first rddata_valid beat.
    uint32_t read_latency = 16;
    /// Cycles from reset or init_start to init_complete.
    uint32_t init_latency = 8;
    /// Raise init_complete after reset without waiting for init_start.
    bool auto_init = true;
    /// When false, READ commands are decoded but no data is returned.
    bool respond_to_reads = true;
};

class PhyModel {
public:
    /// Maximum number of read beats in flight.
    static constexpr int READ_PIPE_DEPTH = 64;

    explicit PhyModel(const PhyConfig& config = PhyConfig{});

    /// Evaluate one clock cycle against the controller's output frame.
    ///
    /// Must be called once per controller tick, after the controller has
    /// driven its frame. Updates signals() for the next controller tick.
    void eval(const DfiOutputs& dfi);

    /// Reset internal state (bank tracking, pipelines, init handshake).
    /// Stored memory contents survive.
    void reset();

    /// Signals presented to the controller on its next tick.
    const PhyInputs& signals() const {
        return signals_;
    }

    /// Read a stored word; unwritten locations read as 0.
    uint64_t read_word(uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col)
        const;

    /// Store a word directly (for preloading test patterns).
    void write_word(
        uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col, uint64_t data
    );

    /// True if a row is open in the addressed bank.
    bool row_open(uint8_t rank, uint8_t bank_group, uint8_t bank) const;

    /// Timing and protocol violations seen since construction or reset().
    const std::vector<std::string>& violations() const {
        return violations_;
    }

    // -- Diagnostic counters --
    uint64_t activate_count() const {
        return activate_count_;
    }
    uint64_t read_count() const {
        return read_count_;
    }
    uint64_t write_count() const {
        return write_count_;
    }
    uint64_t precharge_count() const {
        return precharge_count_;
    }
    uint64_t write_level_strobes() const {
        return write_level_strobes_;
    }
    uint64_t read_level_strobes() const {
        return read_level_strobes_;
    }
    uint64_t init_start_count() const {
        return init_start_count_;
    }

private:
    /// Per-bank row and command history.
    struct BankState {
        bool row_active = false;
        uint32_t active_row = 0;
        std::optional<uint64_t> last_activate;
        std::optional<uint64_t> last_read;
        std::optional<uint64_t> last_write;
        std::optional<uint64_t> last_precharge;
    };

    /// Read beat waiting out the read latency.
    struct ReadPipeEntry {
        bool valid = false;
        uint64_t data = 0;
        uint32_t countdown = 0;
    };

    /// Column burst opened by the last WRITE command.
    struct WriteBurst {
        uint8_t rank = 0;
        uint8_t bank_group = 0;
        uint8_t bank = 0;
        uint32_t row = 0;
        uint32_t col = 0;
        uint32_t beat = 0;
    };

    static uint32_t bank_key(uint8_t rank, uint8_t bank_group, uint8_t bank);
    static uint64_t word_key(
        uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col
    );

    void check_spacing(
        const char* what, const std::optional<uint64_t>& since, uint32_t min_cycles
    );
    void record_violation(std::string msg);
    void handle_command(DfiCommand cmd, const DfiOutputs& dfi);
    void schedule_read(const BankState& bank_state, uint8_t rank, const DfiOutputs& dfi);

    PhyConfig config_;
    PhyInputs signals_;
    uint64_t cycle_ = 0;

    uint32_t init_countdown_ = 0;
    bool init_pending_ = false;

    std::unordered_map<uint32_t, BankState> banks_;
    std::unordered_map<uint32_t, std::optional<uint64_t>> rank_last_activate_;
    std::array<ReadPipeEntry, READ_PIPE_DEPTH> read_pipe_{};
    std::optional<WriteBurst> write_burst_;

    std::vector<std::string> violations_;

    uint64_t activate_count_ = 0;
    uint64_t read_count_ = 0;
    uint64_t write_count_ = 0;
    uint64_t precharge_count_ = 0;
    uint64_t write_level_strobes_ = 0;
    uint64_t read_level_strobes_ = 0;
    uint64_t init_start_count_ = 0;

    /// Sparse memory storage (location key -> 64-bit word).
    std::unordered_map<uint64_t, uint64_t> mem_;
};

} // namespace ddr_dfi
