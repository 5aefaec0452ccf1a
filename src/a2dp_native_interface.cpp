/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#define LOG_TAG "A2dpNativeInterface"

#define LOG_NDEBUG 0

#include "a2dp_native_interface.h"

#include <atomic>
#include <mutex>
#include <utility>

#include "utils/Log.h"

namespace a2dp_bridge {

// Status handed back by the int entry points when no stack is bound.
static const int kNoNativeStackStatus = -1;

static std::mutex sInstanceLock;
static A2dpNativeInterface* sInstance = nullptr;
static std::atomic<A2dpNativeStack*> sDefaultNativeStack{nullptr};

A2dpNativeInterface::A2dpNativeInterface(A2dpNativeStack* nativeStack,
                                         BluetoothAdapter* adapter)
    : mNativeStack(nativeStack), mAdapter(adapter) {
  if (mAdapter == nullptr) {
    ALOG(LOG_FATAL, LOG_TAG, "No Bluetooth Adapter Available");
  }
  if (mNativeStack == nullptr) {
    ALOGE("%s: no native A2DP stack bound", __func__);
  }
}

A2dpNativeInterface* A2dpNativeInterface::GetInstance() {
  std::lock_guard<std::mutex> lock(sInstanceLock);
  if (sInstance == nullptr) {
    sInstance = new A2dpNativeInterface(sDefaultNativeStack.load(),
                                        BluetoothAdapter::GetDefaultAdapter());
  }
  return sInstance;
}

void A2dpNativeInterface::SetDefaultNativeStack(A2dpNativeStack* nativeStack) {
  sDefaultNativeStack.store(nativeStack);
}

void A2dpNativeInterface::Init(
    int maxConnectedAudioDevices,
    const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
    const std::vector<BluetoothCodecConfig>& codecConfigOffload) {
  ALOGI("%s: maxConnectedAudioDevices: %d, priorities: %zu, offload: %zu",
        __func__, maxConnectedAudioDevices, codecConfigPriorities.size(),
        codecConfigOffload.size());
  if (!mNativeStack) return;

  mNativeStack->Init(this, maxConnectedAudioDevices, codecConfigPriorities,
                     codecConfigOffload);
}

void A2dpNativeInterface::Init(
    const A2dpBridgeConfig& config,
    const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
    const std::vector<BluetoothCodecConfig>& codecConfigOffload) {
  if (config.IsOffloadEnabled()) {
    Init(config.GetMaxConnectedAudioDevices(), codecConfigPriorities,
         codecConfigOffload);
  } else {
    Init(config.GetMaxConnectedAudioDevices(), codecConfigPriorities,
         std::vector<BluetoothCodecConfig>());
  }
}

void A2dpNativeInterface::Cleanup() {
  ALOGI("%s", __func__);
  if (!mNativeStack) return;

  mNativeStack->Cleanup();
}

bool A2dpNativeInterface::ConnectA2dp(const BluetoothDevice* device) {
  if (!mNativeStack) return false;

  return mNativeStack->Connect(GetByteAddress(device));
}

bool A2dpNativeInterface::DisconnectA2dp(const BluetoothDevice* device) {
  if (!mNativeStack) return false;

  return mNativeStack->Disconnect(GetByteAddress(device));
}

bool A2dpNativeInterface::SetSilenceDevice(const BluetoothDevice* device,
                                           bool silence) {
  if (!mNativeStack) return false;

  return mNativeStack->SetSilenceDevice(GetByteAddress(device), silence);
}

bool A2dpNativeInterface::SetActiveDevice(const BluetoothDevice* device) {
  if (!mNativeStack) return false;

  return mNativeStack->SetActiveDevice(GetByteAddress(device));
}

bool A2dpNativeInterface::SetCodecConfigPreference(
    const BluetoothDevice* device,
    const std::vector<BluetoothCodecConfig>& codecConfigArray) {
  if (!mNativeStack) return false;

  return mNativeStack->SetCodecConfigPreference(GetByteAddress(device),
                                                codecConfigArray);
}

int A2dpNativeInterface::GetLhdcCodecExtendApiVer(
    const BluetoothDevice* device, std::vector<uint8_t>& exApiVer) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->GetLhdcCodecExtendApiVer(GetByteAddress(device),
                                                exApiVer);
}

int A2dpNativeInterface::GetLhdcCodecExtendApiConfigAr(
    const BluetoothDevice* device, std::vector<uint8_t>& codecConfig) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->GetLhdcCodecExtendApiConfig(GetByteAddress(device),
                                                   codecConfig);
}

int A2dpNativeInterface::SetLhdcCodecExtendApiConfigAr(
    const BluetoothDevice* device, std::vector<uint8_t>& codecConfig) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->SetLhdcCodecExtendApiConfig(GetByteAddress(device),
                                                   codecConfig);
}

// Meta and A2DP codec specific reads share the native config getter.
int A2dpNativeInterface::GetLhdcCodecExtendApiConfigMeta(
    const BluetoothDevice* device, std::vector<uint8_t>& codecConfig) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->GetLhdcCodecExtendApiConfig(GetByteAddress(device),
                                                   codecConfig);
}

int A2dpNativeInterface::GetLhdcCodecExtendApiConfigA2dpCodecSpecific(
    const BluetoothDevice* device, std::vector<uint8_t>& codecConfig) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->GetLhdcCodecExtendApiConfig(GetByteAddress(device),
                                                   codecConfig);
}

int A2dpNativeInterface::SetLhdcCodecExtendApiConfigMeta(
    const BluetoothDevice* device, std::vector<uint8_t>& codecConfig) {
  if (!mNativeStack) return kNoNativeStackStatus;

  return mNativeStack->SetLhdcCodecExtendApiConfig(GetByteAddress(device),
                                                   codecConfig);
}

void A2dpNativeInterface::SetLhdcCodecExtendApiDataGyro2D(
    const BluetoothDevice* device, std::vector<uint8_t>& codecData) {
  if (!mNativeStack) return;

  mNativeStack->SetLhdcCodecExtendApiData(GetByteAddress(device), codecData);
}

void A2dpNativeInterface::RegisterService(
    std::shared_ptr<A2dpServiceInterface> service) {
  std::unique_lock<std::shared_timed_mutex> lock(mServiceMutex);
  if (mService != nullptr) {
    ALOGW("%s: replacing the registered service", __func__);
  }
  mService = std::move(service);
}

void A2dpNativeInterface::UnregisterService() {
  std::unique_lock<std::shared_timed_mutex> lock(mServiceMutex);
  mService.reset();
}

BluetoothDevice A2dpNativeInterface::GetDevice(const BtAddress& address) {
  if (mAdapter == nullptr) {
    ALOGE("%s: no adapter, using raw address %s", __func__,
          address.ToString().c_str());
    return BluetoothDevice(address);
  }
  return mAdapter->GetRemoteDevice(address);
}

BtAddress A2dpNativeInterface::GetByteAddress(const BluetoothDevice* device) {
  if (device == nullptr) {
    return BtAddress::kEmpty;
  }
  return GetBytesFromAddress(device->GetAddress());
}

std::shared_ptr<A2dpServiceInterface> A2dpNativeInterface::GetService() {
  std::shared_lock<std::shared_timed_mutex> lock(mServiceMutex);
  return mService;
}

void A2dpNativeInterface::SendMessageToService(const A2dpStackEvent& event) {
  std::shared_ptr<A2dpServiceInterface> service = GetService();
  if (service == nullptr) {
    ALOGW("Event ignored, service not available: %s", event.ToString().c_str());
    return;
  }
  service->MessageFromNative(event);
}

// Callbacks from the native stack. All of them are routed via the service,
// which decides which state machine the message belongs to.

void A2dpNativeInterface::OnConnectionStateChanged(const BtAddress& address,
                                                   int state) {
  A2dpStackEvent event =
      A2dpStackEvent::ConnectionStateChanged(GetDevice(address), state);
  ALOGD("%s: %s", __func__, event.ToString().c_str());
  SendMessageToService(event);
}

void A2dpNativeInterface::OnAudioStateChanged(const BtAddress& address,
                                              int state) {
  A2dpStackEvent event =
      A2dpStackEvent::AudioStateChanged(GetDevice(address), state);
  ALOGD("%s: %s", __func__, event.ToString().c_str());
  SendMessageToService(event);
}

void A2dpNativeInterface::OnCodecConfigChanged(
    const BtAddress& address, const BluetoothCodecConfig& newCodecConfig,
    const std::vector<BluetoothCodecConfig>& codecsLocalCapabilities,
    const std::vector<BluetoothCodecConfig>& codecsSelectableCapabilities) {
  A2dpStackEvent event = A2dpStackEvent::CodecConfigChanged(
      GetDevice(address),
      BluetoothCodecStatus(newCodecConfig, codecsLocalCapabilities,
                           codecsSelectableCapabilities));
  ALOGD("%s: %s", __func__, event.ToString().c_str());
  SendMessageToService(event);
}

bool A2dpNativeInterface::IsMandatoryCodecPreferred(const BtAddress& address) {
  std::shared_ptr<A2dpServiceInterface> service = GetService();
  if (service == nullptr) {
    ALOGW("%s: service not available", __func__);
    return false;
  }

  int enabled = service->GetOptionalCodecsEnabled(GetDevice(address));
  ALOGD("%s: optional preference %d", __func__, enabled);
  // Optional codecs are preferred unless the user turned them off.
  return enabled == A2dpServiceInterface::OPTIONAL_CODECS_PREF_DISABLED;
}

}  // namespace a2dp_bridge
