#pragma once
#include "hal/HalTypes.hpp"
#include <string>
#include <utility>
#include <vector>

// What a TapManager captures: one process, or the system output mix.
class CaptureTarget {
public:
    enum class Kind { SingleProcess, SystemOutputMix };

    static CaptureTarget singleProcess(HalObjectId process, std::string name,
                                       std::string iconId = {}) {
        CaptureTarget t;
        t.kind_      = Kind::SingleProcess;
        t.processes_ = {process};
        t.name_      = std::move(name);
        t.iconId_    = std::move(iconId);
        return t;
    }

    // `processes` are the audio process objects present when the target
    // was chosen. The tap itself is global and picks up later processes.
    static CaptureTarget systemOutputMix(std::vector<HalObjectId> processes) {
        CaptureTarget t;
        t.kind_      = Kind::SystemOutputMix;
        t.processes_ = std::move(processes);
        t.iconId_    = "application-bundle";
        return t;
    }

    Kind kind() const { return kind_; }
    bool isSystemOutput() const { return kind_ == Kind::SystemOutputMix; }
    const std::vector<HalObjectId>& processes() const { return processes_; }
    const std::string& iconId() const { return iconId_; }

    std::string displayName() const {
        return isSystemOutput() ? "System Audio Output" : name_;
    }

    // Used for logger categories.
    std::string tapName() const {
        return isSystemOutput() ? "SystemAudioOutput" : name_;
    }

    std::string aggregateName() const {
        return isSystemOutput() ? "Tap-SystemOutput" : "Tap-" + name_;
    }

    TapDescription makeTapDescription(MuteBehavior mute, std::string uuid) const {
        TapDescription d;
        d.name         = tapName();
        d.uuid         = std::move(uuid);
        d.muteBehavior = mute;
        d.isPrivate    = true;
        if (isSystemOutput()) {
            // global tap excluding nothing
            d.exclusive = true;
        } else {
            d.exclusive = false;
            d.processes = processes_;
        }
        return d;
    }

private:
    CaptureTarget() = default;

    Kind                     kind_ = Kind::SingleProcess;
    std::vector<HalObjectId> processes_;
    std::string              name_;
    std::string              iconId_;
};
