#pragma once
#include <string>
#include <vector>
#include <ostream>

struct InputDevice {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

// PortAudio devices with at least one input channel
std::vector<InputDevice> listInputDevices();

// Human-readable table for --list-devices; returns false if PortAudio failed
bool printInputDevices(std::ostream& out);
