// Mission-mode command sequencer implementation.
//
// Phase timing. Outputs and beat handling read the pre-tick counters; the
// elapsed-cycle counter then counts the current tick, and the phase exits
// on the tick that brings it to its threshold, so a phase with threshold N
// is held for exactly N ticks:
//   - ACTIVATE:  act_n pulses while activate_cycles == 0; held tRCD ticks.
//   - WRITE:     wrdata_en from write_cycles == tCWL for beats_per_burst
//                cycles; leaves once the burst is done and tWRTP ticks
//                have elapsed.
//   - READ:      rddata_en every cycle; a beat is captured when
//                read_cycles >= tCL and rddata_valid; leaves once the burst
//                is captured and tRTP ticks have elapsed.
//   - PRECHARGE: held tRP ticks.

#include "mission_sequencer.hpp"

#include <bit>
#include <format>
#include <iostream>

namespace ddr_dfi {

const char* to_string(MissionState state) {
    switch (state) {
        case MissionState::IDLE:      return "IDLE";
        case MissionState::ACTIVATE:  return "ACTIVATE";
        case MissionState::READ:      return "READ";
        case MissionState::WRITE:     return "WRITE";
        case MissionState::PRECHARGE: return "PRECHARGE";
    }
    return "INVALID";
}

MissionSequencer::MissionSequencer(
    const TimingConfig& timing, const DfiGeometry& geometry, ReadCaptureQueue& queue
)
    : timing_(timing), geometry_(geometry), queue_(queue) {
    timing_.validate();
    geometry_.validate();
    reset();
}

void MissionSequencer::reset() {
    state_ = MissionState::IDLE;
    counters_ = MissionCounters{};
    in_flight_.reset();
    outputs_ = DfiOutputs{};
    init_wait_cycles_ = 0;
    stalled_ = false;
}

bool MissionSequencer::accepts(const Command& cmd) const {
    switch (cmd.type) {
        case CommandType::READ:
            if (!queue_.can_accept_burst(timing_.beats_per_burst())) {
                return false;
            }
            break;
        case CommandType::WRITE:
            break;
        case CommandType::ACTIVATE:
        case CommandType::PRECHARGE:
        default:
            // Row open/close are implied by every READ/WRITE transaction.
            return false;
    }

    if (std::popcount(cmd.rank) != 1 || (cmd.rank & ~geometry_.rank_mask()) != 0) {
        return false;
    }
    if (cmd.bank >= (1u << geometry_.bank_bits)) {
        return false;
    }
    if (cmd.bank_group >= (1u << geometry_.bank_group_bits)) {
        return false;
    }
    if (static_cast<uint64_t>(cmd.address) >= (uint64_t{1} << geometry_.address_bits)) {
        return false;
    }
    return true;
}

void MissionSequencer::drive_address(DfiOutputs& out, bool command_cycle) const {
    const Command& cmd = *in_flight_;
    out.address = cmd.address;
    out.bank = cmd.bank;
    out.bank_group = cmd.bank_group;
    out.cs_n = command_cycle ? chip_select_n(cmd.rank) : 0xFF;
    out.cke = 1;
}

void MissionSequencer::flag_stall(const char* reason) {
    if (stalled_) {
        return;
    }
    stalled_ = true;
    std::cerr << std::format(
        "WARN: mission sequencer stalled in {}: {} (stall_limit={})\n",
        to_string(state_),
        reason,
        timing_.stall_limit
    );
}

void MissionSequencer::tick(bool cmd_valid, const Command& cmd, const PhyInputs& phy) {
    const uint32_t beats_per_burst = timing_.beats_per_burst();
    DfiOutputs out;

    switch (state_) {
        case MissionState::IDLE: {
            counters_ = MissionCounters{};
            in_flight_.reset();

            if (cmd_valid && !phy.init_complete) {
                init_wait_cycles_++;
                if (timing_.stall_limit != 0 && init_wait_cycles_ > timing_.stall_limit) {
                    flag_stall("command pending but PHY init_complete never asserted");
                }
                break;
            }
            init_wait_cycles_ = 0;

            if (cmd_valid && accepts(cmd)) {
                in_flight_ = cmd;
                state_ = MissionState::ACTIVATE;
            }
            break;
        }

        case MissionState::ACTIVATE: {
            bool first_cycle = (counters_.activate_cycles == 0);
            drive_address(out, first_cycle);
            out.act_n = first_cycle ? 0 : 1;
            out.ras_n = 0;
            if (first_cycle) {
                activate_count_++;
            }

            counters_.activate_cycles++;
            if (counters_.activate_cycles >= timing_.tRCD
                && in_flight_->type == CommandType::WRITE) {
                state_ = MissionState::WRITE;
                counters_.write_cycles = 0;
                counters_.wr_beats = 0;
            } else if (counters_.activate_cycles >= timing_.tRCD
                       && in_flight_->type == CommandType::READ) {
                state_ = MissionState::READ;
                counters_.read_cycles = 0;
                counters_.rd_beats = 0;
            }
            break;
        }

        case MissionState::WRITE: {
            bool first_cycle = (counters_.write_cycles == 0);
            drive_address(out, first_cycle);
            out.cas_n = 0;
            out.we_n = 0;
            out.odt = 1;
            if (first_cycle) {
                write_count_++;
            }
            bool leave = counters_.wr_beats >= beats_per_burst
                         && counters_.write_cycles + 1 >= timing_.tWRTP;

            // Strobe and beat counter share one gate, so the burst never overshoots.
            if (counters_.write_cycles >= timing_.tCWL && counters_.wr_beats < beats_per_burst) {
                out.wrdata_en = 1;
                out.wrdata = in_flight_->beat_data(counters_.wr_beats);
                out.wrdata_mask = in_flight_->beat_mask(counters_.wr_beats);
                out.wrdata_cs_n = chip_select_n(in_flight_->rank);
                counters_.wr_beats++;
            }

            counters_.write_cycles++;
            if (leave) {
                state_ = MissionState::PRECHARGE;
                counters_.precharge_cycles = 0;
            }
            break;
        }

        case MissionState::READ: {
            bool first_cycle = (counters_.read_cycles == 0);
            drive_address(out, first_cycle);
            out.cas_n = 0;
            out.rddata_en = 1;
            out.rddata_cs_n = chip_select_n(in_flight_->rank);
            if (first_cycle) {
                read_count_++;
            }
            bool leave = counters_.rd_beats >= beats_per_burst
                         && counters_.read_cycles + 1 >= timing_.tRTP;

            if (counters_.read_cycles >= timing_.tCL && phy.rddata_valid
                && counters_.rd_beats < beats_per_burst) {
                if (!queue_.push(phy.rddata)) {
                    std::cerr << std::format(
                        "WARN: read capture queue full, beat {} dropped\n", counters_.rd_beats
                    );
                }
                counters_.rd_beats++;
            }

            if (timing_.stall_limit != 0 && counters_.rd_beats < beats_per_burst
                && counters_.read_cycles >= timing_.tCL
                && counters_.read_cycles - timing_.tCL >= timing_.stall_limit) {
                flag_stall("PHY has not returned a full read burst");
            }

            counters_.read_cycles++;
            if (leave) {
                state_ = MissionState::PRECHARGE;
                counters_.precharge_cycles = 0;
            }
            break;
        }

        case MissionState::PRECHARGE: {
            bool first_cycle = (counters_.precharge_cycles == 0);
            drive_address(out, first_cycle);
            out.address = 0; // A10 low: close the addressed bank only
            out.ras_n = 0;
            out.we_n = 0;
            counters_.wr_beats = 0;
            counters_.rd_beats = 0;
            if (first_cycle) {
                precharge_count_++;
            }

            counters_.precharge_cycles++;
            if (counters_.precharge_cycles >= timing_.tRP) {
                state_ = MissionState::IDLE;
                in_flight_.reset();
            }
            break;
        }

        default: {
            std::cerr << std::format(
                "ERROR: mission sequencer in invalid state {}, forcing IDLE\n",
                static_cast<unsigned>(state_)
            );
            state_ = MissionState::IDLE;
            counters_ = MissionCounters{};
            in_flight_.reset();
            break;
        }
    }

    outputs_ = out;
}

} // namespace ddr_dfi
