#include "training_sequencer.hpp"

#include <format>
#include <iostream>

namespace ddr_dfi {

namespace {

/// Leveling strobes fire on every 4th cycle of their window.
constexpr uint32_t LEVELING_STROBE_PERIOD = 4;

/// Training always targets the first rank.
constexpr uint8_t TRAINING_RANK = 0x1;

} // namespace

const char* to_string(TrainingState state) {
    switch (state) {
        case TrainingState::IDLE:        return "IDLE";
        case TrainingState::INIT_DELAY:  return "INIT_DELAY";
        case TrainingState::WRITE_LEVEL: return "WRITE_LEVEL";
        case TrainingState::READ_LEVEL:  return "READ_LEVEL";
        case TrainingState::DONE:        return "DONE";
    }
    return "INVALID";
}

TrainingSequencer::TrainingSequencer(const TrainingConfig& config) : config_(config) {
    config_.validate();
    reset();
}

void TrainingSequencer::clear_phase() {
    init_delay_cycles_ = 0;
    write_lvl_cycles_ = 0;
    read_lvl_cycles_ = 0;
    write_level_done_ = false;
    read_level_done_ = false;
    eye_center_detected_ = false;
}

void TrainingSequencer::reset() {
    state_ = TrainingState::IDLE;
    clear_phase();
    write_strobes_ = 0;
    restart_pending_ = false;
    result_ = TrainingResult{};
    outputs_ = DfiOutputs{};
}

void TrainingSequencer::tick(Mode mode) {
    DfiOutputs out;

    switch (state_) {
        case TrainingState::IDLE: {
            bool armed = !result_.complete || restart_pending_;
            if (mode == Mode::TRAINING && armed) {
                out.init_start = 1;
                result_ = TrainingResult{};
                restart_pending_ = false;
                clear_phase();
                state_ = TrainingState::INIT_DELAY;
            }
            break;
        }

        case TrainingState::INIT_DELAY: {
            out.cke = 1;
            init_delay_cycles_++;
            if (init_delay_cycles_ >= config_.init_delay_target) {
                write_lvl_cycles_ = 0;
                write_strobes_ = 0;
                state_ = TrainingState::WRITE_LEVEL;
            }
            break;
        }

        case TrainingState::WRITE_LEVEL: {
            out.cke = 1;
            if (write_lvl_cycles_ % LEVELING_STROBE_PERIOD == 0) {
                bool odd_strobe = (write_lvl_cycles_ / LEVELING_STROBE_PERIOD) & 1;
                out.wrdata_en = 1;
                out.wrdata = odd_strobe ? ~config_.write_level_pattern : config_.write_level_pattern;
                out.wrdata_mask = 0;
                out.wrdata_cs_n = chip_select_n(TRAINING_RANK);
                write_strobes_++;
            }
            write_lvl_cycles_++;
            if (write_lvl_cycles_ >= config_.write_lvl_training_cycles) {
                write_level_done_ = true;
                read_lvl_cycles_ = 0;
                state_ = TrainingState::READ_LEVEL;
            }
            break;
        }

        case TrainingState::READ_LEVEL: {
            out.cke = 1;
            if (read_lvl_cycles_ % LEVELING_STROBE_PERIOD == 0) {
                out.rddata_en = 1;
                out.rddata_cs_n = chip_select_n(TRAINING_RANK);
            }
            read_lvl_cycles_++;

            // The eye center only counts if it lies inside the window.
            bool eye_hit = config_.eye_center_cycle < config_.read_lvl_training_cycles
                           && read_lvl_cycles_ >= config_.eye_center_cycle;
            if (eye_hit || read_lvl_cycles_ >= config_.read_lvl_training_cycles) {
                read_level_done_ = true;
                eye_center_detected_ = eye_hit;
                state_ = TrainingState::DONE;
            }
            break;
        }

        case TrainingState::DONE: {
            out.cke = 1;
            result_.write_level_done = write_level_done_;
            result_.read_level_done = read_level_done_;
            result_.eye_center_detected = eye_center_detected_;
            result_.complete = true;
            clear_phase();
            state_ = TrainingState::IDLE;
            break;
        }

        default: {
            std::cerr << std::format(
                "ERROR: training sequencer in invalid state {}, forcing IDLE\n",
                static_cast<unsigned>(state_)
            );
            state_ = TrainingState::IDLE;
            clear_phase();
            break;
        }
    }

    outputs_ = out;
}

} // namespace ddr_dfi
