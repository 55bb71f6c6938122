#pragma once

#include <cstdint>
#include <vector>

namespace fmcore {

/**
 * Channel voice message status nibbles
 */
enum class MidiMessageType {
    NoteOff = 0x80,
    NoteOn = 0x90,
    PolyphonicKeyPressure = 0xA0,
    ControlChange = 0xB0,
    ProgramChange = 0xC0,
    ChannelPressure = 0xD0,
    PitchBend = 0xE0,
    SystemMessage = 0xF0
};

/**
 * A single short MIDI message. Channels are 0-based (0..15).
 */
class MidiMessage {
public:
    MidiMessage();
    MidiMessage(MidiMessageType type, uint8_t channel, uint8_t data1, uint8_t data2 = 0);

    // Parses a raw status + data byte sequence. Bytes without a status byte
    // (running status) produce an invalid message.
    explicit MidiMessage(const std::vector<uint8_t>& rawData);

    static MidiMessage noteOn(uint8_t channel, uint8_t note, uint8_t velocity);
    static MidiMessage noteOff(uint8_t channel, uint8_t note, uint8_t velocity = 0);
    static MidiMessage controlChange(uint8_t channel, uint8_t controller, uint8_t value);

    bool isValid() const { return valid_; }
    MidiMessageType getType() const { return type_; }
    uint8_t getChannel() const { return channel_; }
    uint8_t getData1() const { return data1_; }
    uint8_t getData2() const { return data2_; }

    // Note-on with velocity 0 counts as note-off
    bool isNoteOn() const { return valid_ && type_ == MidiMessageType::NoteOn && data2_ > 0; }
    bool isNoteOff() const { return valid_ && (type_ == MidiMessageType::NoteOff ||
                                    (type_ == MidiMessageType::NoteOn && data2_ == 0)); }
    uint8_t getNoteNumber() const { return data1_; }
    uint8_t getVelocity() const { return data2_; }

    bool isControlChange() const { return valid_ && type_ == MidiMessageType::ControlChange; }
    uint8_t getControllerNumber() const { return data1_; }
    uint8_t getControllerValue() const { return data2_; }

    std::vector<uint8_t> getRawData() const;

private:
    MidiMessageType type_;
    uint8_t channel_;
    uint8_t data1_;
    uint8_t data2_;
    bool valid_;
};

} // namespace fmcore
