#include "audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>

std::vector<InputDevice> listInputDevices() {
    std::vector<InputDevice> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    int defaultInput = Pa_GetDefaultInputDevice();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        const PaHostApiInfo* hostApi = Pa_GetHostApiInfo(info->hostApi);

        InputDevice d;
        d.index = i;
        d.name = info->name ? info->name : "";
        d.hostApi = (hostApi && hostApi->name) ? hostApi->name : "";
        d.maxInputChannels = info->maxInputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        d.isDefault = (i == defaultInput);
        devices.push_back(d);
    }

    Pa_Terminate();
    return devices;
}

bool printInputDevices(std::ostream& out) {
    auto devices = listInputDevices();

    out << "=== PortAudio Input Devices ===\n";
    if (devices.empty()) {
        out << "No input devices found\n";
        return false;
    }

    for (const auto& d : devices) {
        out << "Device #" << d.index << ": " << d.name
            << "  (Host API: " << d.hostApi << ")\n";
        out << "  Max input channels : " << d.maxInputChannels << "\n";
        out << "  Default sample rate: " << d.defaultSampleRate << "\n";
        if (d.isDefault) out << "  *** Default INPUT device ***\n";
    }
    out << "\nSet voice.input_device_index in aria_config.json to pick one.\n";
    return true;
}
