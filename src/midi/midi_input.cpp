#include "fmcore/midi/midi_input.h"
#include <cerrno>
#include <chrono>
#include <iostream>

#ifdef FMCORE_USE_ALSA_MIDI
#include <alsa/asoundlib.h>
#endif

namespace fmcore {

namespace {

#ifdef FMCORE_USE_ALSA_MIDI
// Calls fn(clientName, portName, client, port) for every readable, subscribable port
template <typename Fn>
void forEachReadablePort(snd_seq_t* seq, Fn&& fn) {
    snd_seq_client_info_t* cinfo;
    snd_seq_port_info_t* pinfo;
    snd_seq_client_info_alloca(&cinfo);
    snd_seq_port_info_alloca(&pinfo);

    snd_seq_client_info_set_client(cinfo, -1);
    while (snd_seq_query_next_client(seq, cinfo) >= 0) {
        int client = snd_seq_client_info_get_client(cinfo);
        if (client == SND_SEQ_CLIENT_SYSTEM || client == snd_seq_client_id(seq)) {
            continue;
        }

        snd_seq_port_info_set_client(pinfo, client);
        snd_seq_port_info_set_port(pinfo, -1);
        while (snd_seq_query_next_port(seq, pinfo) >= 0) {
            unsigned int caps = snd_seq_port_info_get_capability(pinfo);
            if ((caps & SND_SEQ_PORT_CAP_READ) && (caps & SND_SEQ_PORT_CAP_SUBS_READ)) {
                const char* clientName = snd_seq_client_info_get_name(cinfo);
                const char* portName = snd_seq_port_info_get_name(pinfo);
                fn(std::string(clientName ? clientName : ""),
                   std::string(portName ? portName : ""),
                   client, snd_seq_port_info_get_port(pinfo));
            }
        }
    }
}
#endif

} // namespace

MidiInput::MidiInput(const std::string& clientName)
    : clientName_(clientName)
    , isOpen_(false)
    , isRunning_(false)
    , shouldStop_(false)
    , connectionCount_(0)
    , sequencerHandle_(nullptr)
    , portId_(-1)
{
}

MidiInput::~MidiInput() {
    stop();
    closeDevice();
}

std::vector<std::string> MidiInput::enumerateDevices() {
    std::vector<std::string> devices;

#ifdef FMCORE_USE_ALSA_MIDI
    snd_seq_t* seq = nullptr;
    if (snd_seq_open(&seq, "default", SND_SEQ_OPEN_INPUT, 0) < 0) {
        std::cerr << "MidiInput: Failed to open ALSA sequencer" << std::endl;
        return devices;
    }
    forEachReadablePort(seq, [&devices](const std::string& client, const std::string& port, int, int) {
        devices.push_back(client + ":" + port);
    });
    snd_seq_close(seq);
#endif

    return devices;
}

bool MidiInput::openDevice(const std::string& deviceName) {
    if (isOpen_) {
        closeDevice();
    }

#ifdef FMCORE_USE_ALSA_MIDI
    snd_seq_t* seq = nullptr;
    if (snd_seq_open(&seq, "default", SND_SEQ_OPEN_INPUT, 0) < 0) {
        std::cerr << "MidiInput: Failed to open ALSA sequencer" << std::endl;
        return false;
    }

    snd_seq_set_client_name(seq, clientName_.c_str());

    int port = snd_seq_create_simple_port(seq, "MIDI Input",
                                          SND_SEQ_PORT_CAP_WRITE | SND_SEQ_PORT_CAP_SUBS_WRITE,
                                          SND_SEQ_PORT_TYPE_MIDI_GENERIC | SND_SEQ_PORT_TYPE_APPLICATION);
    if (port < 0) {
        std::cerr << "MidiInput: Failed to create input port" << std::endl;
        snd_seq_close(seq);
        return false;
    }

    size_t connected = 0;
    if (!deviceName.empty()) {
        forEachReadablePort(seq, [&](const std::string& client, const std::string& portName,
                                     int srcClient, int srcPort) {
            if (connected == 0 && client + ":" + portName == deviceName &&
                snd_seq_connect_from(seq, port, srcClient, srcPort) >= 0) {
                ++connected;
            }
        });
        if (connected == 0) {
            std::cerr << "MidiInput: Could not find " << deviceName
                      << ", connecting to all readable ports" << std::endl;
        }
    }

    if (connected == 0) {
        forEachReadablePort(seq, [&](const std::string&, const std::string&, int srcClient, int srcPort) {
            if (snd_seq_connect_from(seq, port, srcClient, srcPort) >= 0) {
                ++connected;
            }
        });
    }

    sequencerHandle_ = seq;
    portId_ = port;
    deviceName_ = deviceName;
    connectionCount_ = connected;
    isOpen_ = true;

    std::cout << "MidiInput: Opened " << (deviceName.empty() ? "all ports" : deviceName)
              << " (" << connected << " connections)" << std::endl;
    return true;
#else
    std::cerr << "MidiInput: Not supported in this build (ALSA not found)" << std::endl;
    return false;
#endif
}

void MidiInput::closeDevice() {
    if (!isOpen_) {
        return;
    }

    stop();

#ifdef FMCORE_USE_ALSA_MIDI
    if (sequencerHandle_) {
        snd_seq_t* seq = static_cast<snd_seq_t*>(sequencerHandle_);
        if (portId_ >= 0) {
            snd_seq_delete_simple_port(seq, portId_);
        }
        snd_seq_close(seq);
    }
#endif
    sequencerHandle_ = nullptr;
    portId_ = -1;
    connectionCount_ = 0;
    isOpen_ = false;
    deviceName_.clear();
}

bool MidiInput::start() {
    if (!isOpen_) {
        std::cerr << "MidiInput: Cannot start, device not open" << std::endl;
        return false;
    }
    if (isRunning_) {
        return true;
    }

    shouldStop_ = false;
    midiThread_ = std::thread(&MidiInput::midiThreadFunction, this);
    isRunning_ = true;

    std::cout << "MidiInput: Started" << std::endl;
    return true;
}

void MidiInput::stop() {
    if (!isRunning_) {
        return;
    }

    shouldStop_ = true;
    if (midiThread_.joinable()) {
        midiThread_.join();
    }
    isRunning_ = false;

    std::cout << "MidiInput: Stopped" << std::endl;
}

void MidiInput::midiThreadFunction() {
#ifdef FMCORE_USE_ALSA_MIDI
    snd_seq_t* seq = static_cast<snd_seq_t*>(sequencerHandle_);
    if (!seq) {
        return;
    }

    snd_seq_nonblock(seq, 1);

    while (!shouldStop_) {
        snd_seq_event_t* ev = nullptr;
        int result = snd_seq_event_input(seq, &ev);

        if (result < 0) {
            if (result == -EAGAIN || result == -ENOSPC) {
                // Nothing pending (or the input FIFO overran); poll again shortly
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            std::cerr << "MidiInput: Sequencer read failed: " << snd_strerror(result) << std::endl;
            break;
        }

        if (!ev || !callback_) {
            continue;
        }

        switch (ev->type) {
            case SND_SEQ_EVENT_NOTEON:
                callback_(MidiMessage::noteOn(ev->data.note.channel, ev->data.note.note,
                                              ev->data.note.velocity));
                break;
            case SND_SEQ_EVENT_NOTEOFF:
                callback_(MidiMessage::noteOff(ev->data.note.channel, ev->data.note.note,
                                               ev->data.note.velocity));
                break;
            case SND_SEQ_EVENT_CONTROLLER:
                callback_(MidiMessage::controlChange(ev->data.control.channel,
                                                     static_cast<uint8_t>(ev->data.control.param),
                                                     static_cast<uint8_t>(ev->data.control.value)));
                break;
            default:
                break;
        }
    }
#endif
}

} // namespace fmcore
