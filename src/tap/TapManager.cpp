#include "tap/TapManager.hpp"
#include "core/SerialQueue.hpp"
#include "core/TaskQueue.hpp"
#include "core/Uuid.hpp"
#include "tap/HardwareDeviceEnumerator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

TapManager::TapManager(IAudioHardware& hardware, TaskQueue& mainQueue,
                       CaptureTarget target, bool muteWhenRunning)
    : hardware_(hardware)
    , mainQueue_(mainQueue)
    , target_(std::move(target))
    , muteWhenRunning_(muteWhenRunning)
    , log_(spdlog::default_logger()->clone("TapManager(" + target_.tapName() + ")"))
{
}

TapManager::~TapManager() {
    invalidate();
}

void TapManager::activate() {
    if (state_ != State::Inactive) return;

    log_->debug("activate");
    state_ = State::Activating;
    activationFailed_ = false;
    errorMessage_.reset();
    errorKind_.reset();

    try {
        prepare();
    } catch (const CaptureError& e) {
        log_->error("{}", e.what());
        activationFailed_ = true;
        recordError(e);
    }

    state_ = State::Active;
    notifyChange();
}

void TapManager::prepare() {
    const std::string tapUuid = makeUuid();
    const TapDescription tapDescription = target_.makeTapDescription(
        muteWhenRunning_ ? MuteBehavior::MutedWhenTapped : MuteBehavior::Unmuted,
        tapUuid);

    if (target_.isSystemOutput())
        log_->debug("Configuring tap for system audio output (all processes)");
    else
        log_->debug("Configuring tap for process object {}", target_.processes().front());

    HalObjectId tapId = kHalUnknownObject;
    HalStatus err = hardware_.createProcessTap(tapDescription, tapId);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::TapCreation,
                           "Process/System tap creation failed with error " +
                               halStatusToString(err),
                           err);
    }
    tapId_ = tapId;
    log_->debug("Created process/system tap #{}", tapId_);

    HardwareDeviceEnumerator enumerator(hardware_);

    std::vector<std::string> outputUids;
    for (HalObjectId device : enumerator.listOutputCapableDevices()) {
        try {
            outputUids.push_back(enumerator.readDeviceUID(device));
        } catch (const CaptureError& e) {
            log_->warn("Ignored device {}: {}", device, e.what());
        }
    }

    if (outputUids.empty()) {
        throw CaptureError(CaptureErrorKind::NoOutputDevices,
                           "No hardware output devices found");
    }

    const HalObjectId systemOutput = enumerator.defaultSystemOutputDevice();
    const std::string mainSubDeviceUid = enumerator.readDeviceUID(systemOutput);

    AggregateDeviceDescription description;
    description.name             = target_.aggregateName();
    description.uid              = makeUuid();
    description.mainSubDeviceUid = mainSubDeviceUid;
    description.isPrivate        = true;
    description.isStacked        = false;
    description.tapAutoStart     = true;
    description.subDeviceUids    = outputUids;
    description.taps.push_back({tapUuid, true});

    StreamFormat format;
    err = hardware_.readTapFormat(tapId_, format);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::FormatUnavailable,
                           "Failed to read tap stream format: " + halStatusToString(err),
                           err);
    }
    if (!format.isValid()) {
        throw CaptureError(CaptureErrorKind::FormatUnavailable,
                           "Tap reported an unusable stream format (" +
                               format.describe() + ")");
    }
    format_ = format;
    log_->debug("Tap format: {}", format.describe());

    HalObjectId aggregateId = kHalUnknownObject;
    err = hardware_.createAggregateDevice(description, aggregateId);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::AggregateCreation,
                           "Failed to create aggregate device: " + halStatusToString(err),
                           err);
    }
    aggregateId_ = aggregateId;
    log_->debug("Created aggregate device #{} with {} sub-devices",
                aggregateId_, outputUids.size());

    std::weak_ptr<int> alive = alive_;
    TaskQueue* mainQueue = &mainQueue_;
    err = hardware_.addDeviceDeathListener(
        aggregateId_,
        [this, alive, mainQueue](HalObjectId device) {
            mainQueue->post([this, alive, device] {
                if (alive.expired()) return;
                onDeviceDied(device);
            });
        },
        deathListenerToken_);
    if (err == kHalNoError)
        deathListenerRegistered_ = true;
    else
        log_->warn("Could not watch aggregate device #{}: {}",
                   aggregateId_, halStatusToString(err));
}

void TapManager::run(SerialQueue& queue, IOBlock ioBlock,
                     InvalidationHandler onInvalidated) {
    if (state_ != State::Active || activationFailed_ ||
        aggregateId_ == kHalUnknownObject) {
        throw std::logic_error("TapManager::run called with inactive tap");
    }
    if (invalidationHandler_ || ioProcId_ != kHalNoIOProc) {
        throw std::logic_error("TapManager::run called with tap already running");
    }

    errorMessage_.reset();
    errorKind_.reset();
    log_->debug("Run tap on queue '{}'", queue.label());

    IOProcId procId = kHalNoIOProc;
    HalStatus err = hardware_.createIOProc(aggregateId_, queue, std::move(ioBlock), procId);
    if (err != kHalNoError) {
        CaptureError e(CaptureErrorKind::DeviceStart,
                       "Failed to create device I/O proc: " + halStatusToString(err), err);
        recordError(e);
        notifyChange();
        throw e;
    }

    err = hardware_.startDevice(aggregateId_, procId);
    if (err != kHalNoError) {
        HalStatus destroyErr = hardware_.destroyIOProc(aggregateId_, procId);
        if (destroyErr != kHalNoError)
            log_->warn("Failed to destroy device I/O proc: {}", halStatusToString(destroyErr));

        CaptureError e(CaptureErrorKind::DeviceStart,
                       "Failed to start audio device: " + halStatusToString(err), err);
        recordError(e);
        notifyChange();
        throw e;
    }

    ioProcId_ = procId;
    invalidationHandler_ = std::move(onInvalidated);
    notifyChange();
}

void TapManager::invalidate() {
    if (state_ != State::Active) return;

    log_->debug("invalidate");

    // Taken out first so a re-entrant invalidate() cannot call it twice.
    InvalidationHandler handler = std::move(invalidationHandler_);
    invalidationHandler_ = nullptr;
    if (handler) handler(*this);

    if (deathListenerRegistered_) {
        HalStatus err = hardware_.removeDeviceDeathListener(aggregateId_, deathListenerToken_);
        if (err != kHalNoError)
            log_->warn("Failed to remove device listener: {}", halStatusToString(err));
        deathListenerRegistered_ = false;
    }

    if (aggregateId_ != kHalUnknownObject) {
        if (ioProcId_ != kHalNoIOProc) {
            HalStatus err = hardware_.stopDevice(aggregateId_, ioProcId_);
            if (err != kHalNoError)
                log_->warn("Failed to stop aggregate device: {}", halStatusToString(err));

            err = hardware_.destroyIOProc(aggregateId_, ioProcId_);
            if (err != kHalNoError)
                log_->warn("Failed to destroy device I/O proc: {}", halStatusToString(err));
            ioProcId_ = kHalNoIOProc;
        }

        HalStatus err = hardware_.destroyAggregateDevice(aggregateId_);
        if (err != kHalNoError)
            log_->warn("Failed to destroy aggregate device: {}", halStatusToString(err));
        aggregateId_ = kHalUnknownObject;
    }

    if (tapId_ != kHalUnknownObject) {
        HalStatus err = hardware_.destroyProcessTap(tapId_);
        if (err != kHalNoError)
            log_->warn("Failed to destroy audio tap: {}", halStatusToString(err));
        tapId_ = kHalUnknownObject;
    }

    format_.reset();
    state_ = State::Invalidated;
    notifyChange();
}

void TapManager::onDeviceDied(HalObjectId device) {
    if (state_ != State::Active) return;
    log_->warn("Device #{} is gone, invalidating tap", device);
    invalidate();
}

void TapManager::recordError(const CaptureError& e) {
    errorMessage_ = e.what();
    errorKind_    = e.kind();
}

void TapManager::notifyChange() {
    if (onChange) onChange();
}
