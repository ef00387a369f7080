#include <CommandInbox.hpp>

CommandInbox::CommandInbox()
    : _modePending(false),
      _mode(OperatingMode::Auto),
      _overwritten(0)
{
}

bool CommandInbox::submit(const ControlCommand& cmd) {
    if (!isValidChannel(cmd.channel)) return false;

    Slot* slot = nullptr;
    switch (cmd.issuer) {
        case CommandIssuer::Manual:
            slot = &_manual[cmd.channel - 1];
            break;
        case CommandIssuer::Safety:
            if (cmd.relayOn) return false;
            slot = &_safety[cmd.channel - 1];
            break;
        default:
            // Auto commands only originate inside the control loop.
            return false;
    }

    if (slot->pending) _overwritten++;
    slot->cmd     = cmd;
    slot->pending = true;
    return true;
}

void CommandInbox::requestMode(OperatingMode mode) {
    if (_modePending) _overwritten++;
    _mode        = mode;
    _modePending = true;
}

bool CommandInbox::takeManual(uint8_t channel, ControlCommand& out) {
    if (!isValidChannel(channel)) return false;
    Slot& s = _manual[channel - 1];
    if (!s.pending) return false;
    out       = s.cmd;
    s.pending = false;
    return true;
}

bool CommandInbox::takeSafety(uint8_t channel, ControlCommand& out) {
    if (!isValidChannel(channel)) return false;
    Slot& s = _safety[channel - 1];
    if (!s.pending) return false;
    out       = s.cmd;
    s.pending = false;
    return true;
}

bool CommandInbox::takeMode(OperatingMode& out) {
    if (!_modePending) return false;
    out          = _mode;
    _modePending = false;
    return true;
}

bool CommandInbox::hasPending() const {
    if (_modePending) return true;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        if (_manual[i].pending || _safety[i].pending) return true;
    }
    return false;
}

void CommandInbox::clear() {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        _manual[i].pending = false;
        _safety[i].pending = false;
    }
    _modePending = false;
}
