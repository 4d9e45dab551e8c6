// Timing table presets and validation.
//
// DDR4 speed-bin values are rounded up from the JEDEC nanosecond minimums
// to DFI cycles at a 1:4 frequency ratio, then expressed in the same units
// the sequencers count.

#include "timing_config.hpp"

#include <format>
#include <stdexcept>

namespace ddr_dfi {

namespace {

void require_positive(uint32_t value, const char* name) {
    if (value == 0) {
        throw std::invalid_argument(std::format("{} must be > 0", name));
    }
}

} // namespace

void TimingConfig::validate() const {
    require_positive(tRCD, "tRCD");
    require_positive(tRP, "tRP");
    require_positive(tRC, "tRC");
    require_positive(tRRD, "tRRD");
    require_positive(tWRTP, "tWRTP");
    require_positive(tRTP, "tRTP");
    require_positive(tRFC, "tRFC");
    require_positive(tCL, "tCL");
    require_positive(tCWL, "tCWL");
    require_positive(burst_length, "burst_length");
    require_positive(dfi_ratio, "dfi_ratio");

    if (burst_length % dfi_ratio != 0 || beats_per_burst() < 1) {
        throw std::invalid_argument(std::format(
            "burst_length ({}) must be a non-zero multiple of dfi_ratio ({})",
            burst_length,
            dfi_ratio
        ));
    }
}

TimingConfig TimingConfig::ddr4_2400() {
    return TimingConfig{};
}

TimingConfig TimingConfig::ddr4_3200() {
    TimingConfig t;
    t.tRCD = 16;
    t.tRP = 16;
    t.tRC = 56;
    t.tRRD = 8;
    t.tWRTP = 26;
    t.tRTP = 10;
    t.tRFC = 440;
    t.tCL = 22;
    t.tCWL = 20;
    return t;
}

void TrainingConfig::validate() const {
    require_positive(init_delay_target, "init_delay_target");
    require_positive(write_lvl_training_cycles, "write_lvl_training_cycles");
    require_positive(read_lvl_training_cycles, "read_lvl_training_cycles");
}

void DfiGeometry::validate() const {
    if (rank_count < 1 || rank_count > 8) {
        throw std::invalid_argument(std::format("rank_count ({}) must be 1..8", rank_count));
    }
    if (bank_bits > 8 || bank_group_bits > 8) {
        throw std::invalid_argument("bank and bank group widths must fit 8-bit buses");
    }
    if (address_bits < 1 || address_bits > 32) {
        throw std::invalid_argument(std::format("address_bits ({}) must be 1..32", address_bits));
    }
}

} // namespace ddr_dfi
