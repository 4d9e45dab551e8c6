// JEDEC timing parameter table and controller configuration records.
//
// All timing values are in controller (DFI) clock cycles. The sequencers
// compare their elapsed-cycle counters against these values with `>=`, so
// a counter that overruns a threshold during a stall is tolerated.
//
// Burst geometry: one DRAM burst of `burst_length` beats is transferred
// over `burst_length / dfi_ratio` DFI cycles. The model calls each DFI
// cycle of a burst a "beat" (beats_per_burst()).

#pragma once

#include <cstdint>

namespace ddr_dfi {

/// Static JEDEC-derived cycle counts plus burst/ratio constants.
struct TimingConfig {
    uint32_t tRCD = 13;  ///< ACTIVATE to READ/WRITE
    uint32_t tRP = 13;   ///< PRECHARGE to next ACTIVATE
    uint32_t tRC = 45;   ///< ACTIVATE to ACTIVATE, same bank
    uint32_t tRRD = 6;   ///< ACTIVATE to ACTIVATE, different bank
    uint32_t tWRTP = 20; ///< WRITE to PRECHARGE
    uint32_t tRTP = 8;   ///< READ to PRECHARGE
    uint32_t tRFC = 350; ///< Refresh cycle time
    uint32_t tCL = 16;   ///< CAS (read) latency
    uint32_t tCWL = 16;  ///< CAS write latency

    uint32_t burst_length = 8; ///< DRAM burst length (BL8)
    uint32_t dfi_ratio = 4;    ///< DRAM clocks per DFI clock (1:4)

    /// Liveness watchdog margin in cycles; 0 disables the watchdog.
    uint32_t stall_limit = 0;

    /// Number of DFI data cycles per burst.
    uint32_t beats_per_burst() const {
        return burst_length / dfi_ratio;
    }

    /// Check the invariants of the table.
    ///
    /// @throws std::invalid_argument naming the first offending field.
    void validate() const;

    /// DDR4-2400 speed bin at a 1:4 DFI ratio (the default values).
    static TimingConfig ddr4_2400();

    /// DDR4-3200 speed bin at a 1:4 DFI ratio.
    static TimingConfig ddr4_3200();
};

/// Calibration sequence parameters (all in cycles).
struct TrainingConfig {
    uint32_t init_delay_target = 32;          ///< INIT_DELAY dwell before write leveling
    uint32_t write_lvl_training_cycles = 64;  ///< WRITE_LEVEL window
    uint32_t read_lvl_training_cycles = 128;  ///< READ_LEVEL timeout window
    uint32_t eye_center_cycle = 40;           ///< Mock eye-center hit during READ_LEVEL
    uint64_t write_level_pattern = 0xAAAA5555AAAA5555ULL;

    /// @throws std::invalid_argument on a zero-length window.
    void validate() const;
};

/// Address geometry the command fields are checked against.
struct DfiGeometry {
    uint8_t rank_count = 2;
    uint8_t bank_bits = 2;
    uint8_t bank_group_bits = 2;
    uint8_t address_bits = 17;

    /// Mask covering every valid one-hot rank bit.
    uint8_t rank_mask() const {
        return static_cast<uint8_t>((1u << rank_count) - 1u);
    }

    /// @throws std::invalid_argument if a width does not fit the DFI buses.
    void validate() const;
};

} // namespace ddr_dfi
