#include "fmcore/midi/midi_message.h"

#include <cstddef>

namespace fmcore {

MidiMessage::MidiMessage()
    : type_(MidiMessageType::NoteOff)
    , channel_(0)
    , data1_(0)
    , data2_(0)
    , valid_(false)
{
}

MidiMessage::MidiMessage(MidiMessageType type, uint8_t channel, uint8_t data1, uint8_t data2)
    : type_(type)
    , channel_(channel & 0x0F)  // Channel is 4 bits
    , data1_(data1 & 0x7F)      // Data is 7 bits
    , data2_(data2 & 0x7F)
    , valid_(true)
{
}

MidiMessage::MidiMessage(const std::vector<uint8_t>& rawData)
    : MidiMessage()
{
    if (rawData.empty() || (rawData[0] & 0x80) == 0) {
        return;
    }

    uint8_t status = rawData[0];
    type_ = static_cast<MidiMessageType>(status & 0xF0);
    channel_ = status & 0x0F;
    data1_ = rawData.size() > 1 ? (rawData[1] & 0x7F) : 0;
    data2_ = rawData.size() > 2 ? (rawData[2] & 0x7F) : 0;

    // Two-byte messages need only one data byte
    std::size_t required = 3;
    if (type_ == MidiMessageType::ProgramChange || type_ == MidiMessageType::ChannelPressure) {
        required = 2;
    } else if (type_ == MidiMessageType::SystemMessage) {
        required = 1;
    }
    valid_ = rawData.size() >= required;
}

MidiMessage MidiMessage::noteOn(uint8_t channel, uint8_t note, uint8_t velocity) {
    return MidiMessage(MidiMessageType::NoteOn, channel, note, velocity);
}

MidiMessage MidiMessage::noteOff(uint8_t channel, uint8_t note, uint8_t velocity) {
    return MidiMessage(MidiMessageType::NoteOff, channel, note, velocity);
}

MidiMessage MidiMessage::controlChange(uint8_t channel, uint8_t controller, uint8_t value) {
    return MidiMessage(MidiMessageType::ControlChange, channel, controller, value);
}

std::vector<uint8_t> MidiMessage::getRawData() const {
    std::vector<uint8_t> data;
    if (!valid_) {
        return data;
    }
    data.push_back(static_cast<uint8_t>(type_) | channel_);
    if (type_ == MidiMessageType::SystemMessage) {
        return data;
    }
    data.push_back(data1_);
    if (type_ != MidiMessageType::ProgramChange &&
        type_ != MidiMessageType::ChannelPressure) {
        data.push_back(data2_);
    }
    return data;
}

} // namespace fmcore
