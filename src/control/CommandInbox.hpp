/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef COMMAND_INBOX_H
#define COMMAND_INBOX_H

#include <ControlTypes.hpp>

/*
 * CommandInbox
 *
 * Holding area between the bus callbacks and RelayControlLoop::tick().
 * Filled while the bus is serviced between measurement windows, drained once
 * per tick by the control loop.
 *
 *  - One slot per channel for manual commands: the most recent one wins,
 *    older unapplied commands are overwritten (never queued).
 *  - One slot per channel for safety commands (always OFF).
 *  - One slot for a pending mode change.
 *
 * Not thread-safe: producer and consumer run in the same loop task.
 */
class CommandInbox {
public:
    CommandInbox();

    // Rejects invalid channels, issuer=auto, and safety commands asking for ON.
    bool submit(const ControlCommand& cmd);
    void requestMode(OperatingMode mode);

    bool takeManual(uint8_t channel, ControlCommand& out);
    bool takeSafety(uint8_t channel, ControlCommand& out);
    bool takeMode(OperatingMode& out);

    bool hasPending() const;
    void clear();

    uint32_t overwritten() const { return _overwritten; }

private:
    struct Slot {
        bool           pending = false;
        ControlCommand cmd;
    };

    Slot          _manual[LOAD_CHANNEL_COUNT];
    Slot          _safety[LOAD_CHANNEL_COUNT];
    bool          _modePending;
    OperatingMode _mode;
    uint32_t      _overwritten;
};

#endif // COMMAND_INBOX_H
