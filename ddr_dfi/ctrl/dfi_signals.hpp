// DFI signal frame and command records.
//
// The controller writes one DfiOutputs frame per tick and samples one
// PhyInputs record per tick. Signal names follow the DFI convention
// (dfi_cs_n, dfi_wrdata_en, ...) without the dfi_ prefix. All *_n signals
// are active-low; chip selects carry one bit per rank.
//
// DDR4 command encoding on {act_n, ras_n, cas_n, we_n} with cs_n low:
//
//   | Command   | act_n | ras_n | cas_n | we_n |
//   |-----------|-------|-------|-------|------|
//   | ACTIVATE  |   0   |   x   |   x   |  x   |
//   | WRITE     |   1   |   1   |   0   |  0   |
//   | READ      |   1   |   1   |   0   |  1   |
//   | PRECHARGE |   1   |   0   |   1   |  0   |
//   | NOP/DES   |   1   |   1   |   1   |  1   |

#pragma once

#include <cstdint>
#include <vector>

namespace ddr_dfi {

/// Mode flag selecting which sequencer owns the shared drivers.
enum class Mode : uint8_t {
    TRAINING = 0,
    MISSION = 1,
};

/// Command type codes as presented on the cmd_type input.
enum class CommandType : uint8_t {
    ACTIVATE = 0,
    READ = 1,
    WRITE = 2,
    PRECHARGE = 3,
};

/// A request presented by the command issuer.
///
/// write_data / write_mask hold one entry per beat; beat i uses entry
/// (i % size). An empty list drives zero.
struct Command {
    CommandType type = CommandType::READ;
    uint8_t rank = 0x1;     ///< One-hot rank selector
    uint8_t bank = 0;
    uint8_t bank_group = 0;
    uint32_t address = 0;   ///< Row address on ACTIVATE, column on READ/WRITE
    std::vector<uint64_t> write_data;
    std::vector<uint8_t> write_mask; ///< One bit per byte lane, 1 = masked

    uint64_t beat_data(uint32_t beat) const {
        return write_data.empty() ? 0 : write_data[beat % write_data.size()];
    }

    uint8_t beat_mask(uint32_t beat) const {
        return write_mask.empty() ? 0 : write_mask[beat % write_mask.size()];
    }
};

/// Signals sampled from the PHY each tick.
struct PhyInputs {
    uint64_t rddata = 0;
    uint8_t rddata_valid = 0;
    uint8_t init_complete = 0;
};

/// Signals driven toward the PHY each tick.
struct DfiOutputs {
    // Command / address channel
    uint32_t address = 0;
    uint8_t bank = 0;
    uint8_t bank_group = 0;
    uint8_t cs_n = 0xFF;
    uint8_t act_n = 1;
    uint8_t ras_n = 1;
    uint8_t cas_n = 1;
    uint8_t we_n = 1;
    uint8_t cke = 0;
    uint8_t odt = 0;
    uint8_t reset_n = 1; ///< Held de-asserted; the PHY is pre-initialized

    // Write data channel
    uint64_t wrdata = 0;
    uint8_t wrdata_en = 0;
    uint8_t wrdata_cs_n = 0xFF;
    uint8_t wrdata_mask = 0;

    // Read data channel
    uint8_t rddata_en = 0;
    uint8_t rddata_cs_n = 0xFF;

    // Status interface
    uint8_t init_start = 0;
};

/// Per-tick inputs of the controller top level.
struct ControllerInputs {
    Mode mode = Mode::MISSION;
    uint8_t reset = 0;
    uint8_t cmd_valid = 0;
    Command cmd;
    PhyInputs phy;
};

/// Active-low chip-select pattern for a one-hot rank selector.
inline uint8_t chip_select_n(uint8_t one_hot_rank) {
    return static_cast<uint8_t>(~one_hot_rank);
}

} // namespace ddr_dfi
