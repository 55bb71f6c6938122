#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "fmcore/midi/midi_message.h"

namespace fmcore {

/**
 * ALSA sequencer MIDI input.
 *
 * Creates a writable sequencer port, subscribes it to one named source port
 * (or to every readable port) and delivers note and controller events to the
 * callback from a dedicated polling thread.
 */
class MidiInput {
public:
    using MidiCallback = std::function<void(const MidiMessage&)>;

    explicit MidiInput(const std::string& clientName = "fmcore");
    ~MidiInput();

    MidiInput(const MidiInput&) = delete;
    MidiInput& operator=(const MidiInput&) = delete;

    // Readable sequencer ports as "Client:Port"
    static std::vector<std::string> enumerateDevices();

    // An empty name, or one that matches no port, connects to every readable port
    bool openDevice(const std::string& deviceName);
    void closeDevice();
    bool isOpen() const { return isOpen_; }

    bool start();
    void stop();
    bool isRunning() const { return isRunning_; }

    // Called on the MIDI thread; must be set before start()
    void setCallback(MidiCallback callback) { callback_ = callback; }

    std::string getDeviceName() const { return deviceName_; }
    size_t getConnectionCount() const { return connectionCount_; }

private:
    void midiThreadFunction();

    std::string clientName_;
    std::string deviceName_;
    bool isOpen_;
    bool isRunning_;
    std::atomic<bool> shouldStop_;
    std::thread midiThread_;
    MidiCallback callback_;
    size_t connectionCount_;

    // ALSA sequencer handle (opaque pointer)
    void* sequencerHandle_;
    int portId_;
};

} // namespace fmcore
