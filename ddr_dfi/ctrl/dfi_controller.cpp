#include "dfi_controller.hpp"

namespace ddr_dfi {

DfiController::DfiController(const ControllerConfig& config)
    : config_(config),
      queue_(config.queue_capacity, config.overflow_policy),
      mission_(config.timing, config.geometry, queue_),
      training_(config.training) {}

void DfiController::apply_reset() {
    mission_.reset();
    training_.reset();
    queue_.clear();
    outputs_ = DfiOutputs{};
}

void DfiController::tick(const ControllerInputs& in) {
    cycle_++;

    if (in.reset) {
        apply_reset();
        return;
    }

    // Commands are only offered while mission mode owns the drivers.
    bool cmd_valid = in.cmd_valid && in.mode == Mode::MISSION;

    mission_.tick(cmd_valid, in.cmd, in.phy);
    training_.tick(in.mode);

    if (in.mode == Mode::MISSION) {
        outputs_ = mission_.outputs();
    } else {
        outputs_ = training_.outputs();
        outputs_.odt = 0;
    }
    outputs_.reset_n = 1;
}

} // namespace ddr_dfi
