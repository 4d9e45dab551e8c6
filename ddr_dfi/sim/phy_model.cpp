// Behavioral DFI PHY + DRAM model implementation.
//
// Per-cycle order of evaluation:
//   1. Clear single-cycle pulse outputs (rddata_valid).
//   2. Advance the init handshake.
//   3. Advance the read pipeline and drive any matured beat.
//   4. Decode and apply the command on the command bus.
//   5. Capture write data qualified by wrdata_en.
//
// Spacing checks (cycles between command issues):
//   ACTIVATE  <- PRECHARGE (tRP), ACTIVATE same bank (tRC),
//                ACTIVATE same rank (tRRD)
//   READ      <- ACTIVATE (tRCD)
//   WRITE     <- ACTIVATE (tRCD)
//   PRECHARGE <- READ (tRTP), WRITE (tWRTP)

#include "phy_model.hpp"

#include <bit>
#include <format>
#include <iostream>

namespace ddr_dfi {

const char* to_string(DfiCommand cmd) {
    switch (cmd) {
        case DfiCommand::NOP:       return "NOP";
        case DfiCommand::ACTIVATE:  return "ACTIVATE";
        case DfiCommand::READ:      return "READ";
        case DfiCommand::WRITE:     return "WRITE";
        case DfiCommand::PRECHARGE: return "PRECHARGE";
        case DfiCommand::OTHER:     return "OTHER";
    }
    return "INVALID";
}

DfiCommand decode_command(const DfiOutputs& dfi) {
    if (static_cast<uint8_t>(~dfi.cs_n) == 0) {
        return DfiCommand::NOP;
    }
    if (!dfi.act_n) {
        return DfiCommand::ACTIVATE;
    }

    // {ras_n, cas_n, we_n}
    auto code = static_cast<uint8_t>(
        ((dfi.ras_n & 1) << 2) | ((dfi.cas_n & 1) << 1) | ((dfi.we_n & 1) << 0)
    );
    switch (code) {
        case 0b111: return DfiCommand::NOP;
        case 0b100: return DfiCommand::WRITE;
        case 0b101: return DfiCommand::READ;
        case 0b010: return DfiCommand::PRECHARGE;
        default:    return DfiCommand::OTHER;
    }
}

PhyModel::PhyModel(const PhyConfig& config) : config_(config) {
    config_.timing.validate();
    if (config_.read_latency == 0) {
        config_.read_latency = 1;
    }
    reset();
}

void PhyModel::reset() {
    signals_ = PhyInputs{};
    cycle_ = 0;
    banks_.clear();
    rank_last_activate_.clear();
    read_pipe_ = {};
    write_burst_.reset();
    violations_.clear();

    init_pending_ = config_.auto_init;
    init_countdown_ = config_.init_latency;
    if (init_pending_ && init_countdown_ == 0) {
        signals_.init_complete = 1;
        init_pending_ = false;
    }
}

uint32_t PhyModel::bank_key(uint8_t rank, uint8_t bank_group, uint8_t bank) {
    return (static_cast<uint32_t>(rank) << 16) | (static_cast<uint32_t>(bank_group) << 8) | bank;
}

uint64_t PhyModel::word_key(
    uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col
) {
    // rank[63:60] | bank_group[59:52] | bank[51:44] | row[43:24] | col[23:0]
    return (static_cast<uint64_t>(rank & 0xF) << 60) | (static_cast<uint64_t>(bank_group) << 52)
           | (static_cast<uint64_t>(bank) << 44) | (static_cast<uint64_t>(row & 0xFFFFF) << 24)
           | (col & 0xFFFFFF);
}

uint64_t PhyModel::read_word(
    uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col
) const {
    auto it = mem_.find(word_key(rank, bank_group, bank, row, col));
    if (it != mem_.end()) {
        return it->second;
    }
    return 0;
}

void PhyModel::write_word(
    uint8_t rank, uint8_t bank_group, uint8_t bank, uint32_t row, uint32_t col, uint64_t data
) {
    mem_[word_key(rank, bank_group, bank, row, col)] = data;
}

bool PhyModel::row_open(uint8_t rank, uint8_t bank_group, uint8_t bank) const {
    auto it = banks_.find(bank_key(rank, bank_group, bank));
    return it != banks_.end() && it->second.row_active;
}

void PhyModel::check_spacing(
    const char* what, const std::optional<uint64_t>& since, uint32_t min_cycles
) {
    if (!since) {
        return;
    }
    uint64_t elapsed = cycle_ - *since;
    if (elapsed < min_cycles) {
        std::string msg = std::format(
            "cycle {}: {} spacing {} < {} cycles", cycle_, what, elapsed, min_cycles
        );
        record_violation(std::move(msg));
    }
}

void PhyModel::record_violation(std::string msg) {
    std::cerr << std::format("WARN: PHY protocol violation: {}\n", msg);
    violations_.push_back(std::move(msg));
}

void PhyModel::schedule_read(const BankState& bank_state, uint8_t rank, const DfiOutputs& dfi) {
    if (!config_.respond_to_reads) {
        return;
    }
    const uint32_t beats = config_.timing.beats_per_burst();
    for (uint32_t beat = 0; beat < beats; beat++) {
        // Find an empty slot in the read pipeline
        ReadPipeEntry* slot = nullptr;
        for (auto& entry : read_pipe_) {
            if (!entry.valid) {
                slot = &entry;
                break;
            }
        }
        if (slot == nullptr) {
            record_violation(std::format("cycle {}: read pipeline overflow", cycle_));
            return;
        }
        slot->valid = true;
        slot->data = read_word(
            rank, dfi.bank_group, dfi.bank, bank_state.active_row, dfi.address + beat
        );
        // read_latency - 1: the beat is driven at the end of eval() and
        // sampled by the controller on its next tick.
        slot->countdown = config_.read_latency - 1 + beat;
    }
}

void PhyModel::handle_command(DfiCommand cmd, const DfiOutputs& dfi) {
    auto selected = static_cast<uint8_t>(~dfi.cs_n);
    if (std::popcount(selected) > 1) {
        record_violation(
            std::format("cycle {}: {} with multiple ranks selected", cycle_, to_string(cmd))
        );
    }
    auto rank = static_cast<uint8_t>(std::countr_zero(selected));
    BankState& bank_state = banks_[bank_key(rank, dfi.bank_group, dfi.bank)];

    switch (cmd) {
        case DfiCommand::ACTIVATE: {
            if (bank_state.row_active) {
                record_violation(std::format("cycle {}: ACTIVATE to an open bank", cycle_));
            }
            const TimingConfig& t = config_.timing;
            check_spacing("PRECHARGE->ACTIVATE (tRP)", bank_state.last_precharge, t.tRP);
            check_spacing("ACTIVATE->ACTIVATE (tRC)", bank_state.last_activate, t.tRC);
            check_spacing("ACTIVATE->ACTIVATE same rank (tRRD)", rank_last_activate_[rank], t.tRRD);
            bank_state.row_active = true;
            bank_state.active_row = dfi.address;
            bank_state.last_activate = cycle_;
            bank_state.last_read.reset();
            bank_state.last_write.reset();
            rank_last_activate_[rank] = cycle_;
            activate_count_++;
            break;
        }

        case DfiCommand::READ: {
            if (!bank_state.row_active) {
                record_violation(std::format("cycle {}: READ to a closed bank", cycle_));
            }
            check_spacing("ACTIVATE->READ (tRCD)", bank_state.last_activate, config_.timing.tRCD);
            bank_state.last_read = cycle_;
            schedule_read(bank_state, rank, dfi);
            read_count_++;
            break;
        }

        case DfiCommand::WRITE: {
            if (!bank_state.row_active) {
                record_violation(std::format("cycle {}: WRITE to a closed bank", cycle_));
            }
            check_spacing("ACTIVATE->WRITE (tRCD)", bank_state.last_activate, config_.timing.tRCD);
            bank_state.last_write = cycle_;
            write_burst_ = WriteBurst{
                rank, dfi.bank_group, dfi.bank, bank_state.active_row, dfi.address, 0
            };
            write_count_++;
            break;
        }

        case DfiCommand::PRECHARGE: {
            check_spacing("READ->PRECHARGE (tRTP)", bank_state.last_read, config_.timing.tRTP);
            check_spacing("WRITE->PRECHARGE (tWRTP)", bank_state.last_write, config_.timing.tWRTP);
            bank_state.row_active = false;
            bank_state.last_precharge = cycle_;
            if (write_burst_ && write_burst_->rank == rank && write_burst_->bank == dfi.bank
                && write_burst_->bank_group == dfi.bank_group) {
                write_burst_.reset();
            }
            precharge_count_++;
            break;
        }

        case DfiCommand::NOP:
        case DfiCommand::OTHER:
        default:
            break;
    }
}

void PhyModel::eval(const DfiOutputs& dfi) {
    cycle_++;

    // Clear single-cycle pulse outputs at the start of each cycle.
    signals_.rddata_valid = 0;
    signals_.rddata = 0;

    // Step 1: init handshake
    if (dfi.init_start) {
        init_start_count_++;
        signals_.init_complete = 0;
        init_pending_ = true;
        init_countdown_ = config_.init_latency;
    } else if (init_pending_) {
        if (init_countdown_ > 0) {
            init_countdown_--;
        }
        if (init_countdown_ == 0) {
            signals_.init_complete = 1;
            init_pending_ = false;
        }
    }

    // Step 2: advance read pipeline, drive the matured beat
    for (auto& entry : read_pipe_) {
        if (!entry.valid) {
            continue;
        }
        if (entry.countdown > 0) {
            entry.countdown--;
        }
        if (entry.countdown == 0) {
            signals_.rddata = entry.data;
            signals_.rddata_valid = 1;
            entry.valid = false;
        }
    }

    // Step 3: command decode
    DfiCommand cmd = decode_command(dfi);
    if (cmd != DfiCommand::NOP) {
        handle_command(cmd, dfi);
    }

    // Step 4: write data capture
    if (dfi.wrdata_en) {
        if (write_burst_) {
            WriteBurst& burst = *write_burst_;
            uint32_t col = burst.col + burst.beat;
            uint64_t word = read_word(burst.rank, burst.bank_group, burst.bank, burst.row, col);
            // wrdata_mask bit i = 1 keeps byte lane i unchanged
            for (int lane = 0; lane < 8; lane++) {
                uint64_t lane_bits = uint64_t{0xFF} << (lane * 8);
                if (!((dfi.wrdata_mask >> lane) & 1)) {
                    word = (word & ~lane_bits) | (dfi.wrdata & lane_bits);
                }
            }
            write_word(burst.rank, burst.bank_group, burst.bank, burst.row, col, word);
            burst.beat++;
        } else {
            write_level_strobes_++;
        }
    }

    if (dfi.rddata_en && cmd != DfiCommand::READ) {
        bool any_open = false;
        for (const auto& entry : banks_) {
            any_open = any_open || entry.second.row_active;
        }
        if (!any_open) {
            read_level_strobes_++;
        }
    }
}

} // namespace ddr_dfi
