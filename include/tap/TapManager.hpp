#pragma once
#include "CaptureTarget.hpp"
#include "core/CaptureError.hpp"
#include "hal/IAudioHardware.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spdlog { class logger; }
class SerialQueue;
class TaskQueue;

// Owns one OS-level tap and the private aggregate device that hosts it.
//
// Lifecycle: Inactive -> activate() -> Active -> invalidate() -> Invalidated.
// Activation failures are recorded on the instance (errorMessage(),
// errorKind()) rather than thrown. The destructor invalidates.
//
// All methods must be called from the coordinating TaskQueue's thread.
// Device-death notifications from the backend are posted there.
class TapManager {
public:
    enum class State { Inactive, Activating, Active, Invalidated };

    using InvalidationHandler = std::function<void(TapManager&)>;

    TapManager(IAudioHardware& hardware, TaskQueue& mainQueue,
               CaptureTarget target, bool muteWhenRunning = false);
    ~TapManager();

    TapManager(const TapManager&) = delete;
    TapManager& operator=(const TapManager&) = delete;

    // Creates the tap and aggregate device. No-op unless Inactive.
    void activate();

    // Registers `ioBlock` on the aggregate device, delivering on `queue`,
    // and starts the device. `onInvalidated` runs exactly once, from
    // invalidate(). Throws std::logic_error when not activated
    // successfully or already running; CaptureError(DeviceStart) when the
    // I/O proc cannot be created or started.
    void run(SerialQueue& queue, IOBlock ioBlock, InvalidationHandler onInvalidated);

    // Tears everything down: handler, device stop, I/O proc, aggregate
    // device, tap. No-op unless Active.
    void invalidate();

    // Observable state
    State state() const { return state_; }
    bool activated() const { return state_ == State::Active; }
    // True when the last activate() recorded an error. A failed run()
    // records its error too but leaves this false.
    bool activationFailed() const { return activationFailed_; }
    bool isRunning() const { return ioProcId_ != kHalNoIOProc; }
    const std::optional<std::string>& errorMessage() const { return errorMessage_; }
    std::optional<CaptureErrorKind> errorKind() const { return errorKind_; }
    const std::optional<StreamFormat>& streamFormat() const { return format_; }
    const CaptureTarget& target() const { return target_; }
    std::string displayName() const { return target_.displayName(); }
    bool muteWhenRunning() const { return muteWhenRunning_; }

    HalObjectId tapId() const { return tapId_; }
    HalObjectId aggregateDeviceId() const { return aggregateId_; }

    // Fired on the coordinating thread after an observable change.
    std::function<void()> onChange;

private:
    void prepare();
    void recordError(const CaptureError& e);
    void notifyChange();
    void onDeviceDied(HalObjectId device);

    IAudioHardware&                 hardware_;
    TaskQueue&                      mainQueue_;
    CaptureTarget                   target_;
    bool                            muteWhenRunning_;
    std::shared_ptr<spdlog::logger> log_;

    State                           state_ = State::Inactive;
    bool                            activationFailed_ = false;
    std::optional<std::string>      errorMessage_;
    std::optional<CaptureErrorKind> errorKind_;

    HalObjectId                     tapId_       = kHalUnknownObject;
    HalObjectId                     aggregateId_ = kHalUnknownObject;
    IOProcId                        ioProcId_    = kHalNoIOProc;
    uint64_t                        deathListenerToken_ = 0;
    bool                            deathListenerRegistered_ = false;
    std::optional<StreamFormat>     format_;
    InvalidationHandler             invalidationHandler_;

    // Expires with the manager; posted tasks check it before touching `this`.
    std::shared_ptr<int>            alive_ = std::make_shared<int>(0);
};
