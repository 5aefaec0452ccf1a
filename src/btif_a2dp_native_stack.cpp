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

#define LOG_TAG "BtifA2dpNativeStack"

#define LOG_NDEBUG 0

#include "btif_a2dp_native_stack.h"

#include <string.h>

#include <shared_mutex>

#include "utils/Log.h"

namespace a2dp_bridge {

static const btav_source_interface_t* sBluetoothA2dpInterface = nullptr;
static std::shared_timed_mutex interface_mutex;

static A2dpNativeCallbacks* sCallbacks = nullptr;
static std::shared_timed_mutex callbacks_mutex;

// The instance whose Init last succeeded. Guarded by interface_mutex.
static const BtifA2dpNativeStack* sOwner = nullptr;

static RawAddress ToRawAddress(const BtAddress& address) {
  RawAddress bd_addr;
  memcpy(bd_addr.address, address.data(), BtAddress::kLength);
  return bd_addr;
}

BluetoothCodecConfig FromBtavCodecConfig(
    const btav_a2dp_codec_config_t& codec_config) {
  return BluetoothCodecConfig(
      codec_config.codec_type, codec_config.codec_priority,
      codec_config.sample_rate, codec_config.bits_per_sample,
      codec_config.channel_mode, codec_config.codec_specific_1,
      codec_config.codec_specific_2, codec_config.codec_specific_3,
      codec_config.codec_specific_4);
}

btav_a2dp_codec_config_t ToBtavCodecConfig(
    const BluetoothCodecConfig& codecConfig) {
  btav_a2dp_codec_config_t codec_config = {
      .codec_type =
          static_cast<btav_a2dp_codec_index_t>(codecConfig.GetCodecType()),
      .codec_priority = static_cast<btav_a2dp_codec_priority_t>(
          codecConfig.GetCodecPriority()),
      .sample_rate = static_cast<btav_a2dp_codec_sample_rate_t>(
          codecConfig.GetSampleRate()),
      .bits_per_sample = static_cast<btav_a2dp_codec_bits_per_sample_t>(
          codecConfig.GetBitsPerSample()),
      .channel_mode = static_cast<btav_a2dp_codec_channel_mode_t>(
          codecConfig.GetChannelMode()),
      .codec_specific_1 = codecConfig.GetCodecSpecific1(),
      .codec_specific_2 = codecConfig.GetCodecSpecific2(),
      .codec_specific_3 = codecConfig.GetCodecSpecific3(),
      .codec_specific_4 = codecConfig.GetCodecSpecific4()};
  return codec_config;
}

static std::vector<BluetoothCodecConfig> FromBtavCodecConfigs(
    const std::vector<btav_a2dp_codec_config_t>& codec_configs) {
  std::vector<BluetoothCodecConfig> result;
  result.reserve(codec_configs.size());
  for (const auto& codec_config : codec_configs) {
    result.push_back(FromBtavCodecConfig(codec_config));
  }
  return result;
}

static std::vector<btav_a2dp_codec_config_t> ToBtavCodecConfigs(
    const std::vector<BluetoothCodecConfig>& codecConfigs) {
  std::vector<btav_a2dp_codec_config_t> result;
  result.reserve(codecConfigs.size());
  for (const auto& codecConfig : codecConfigs) {
    result.push_back(ToBtavCodecConfig(codecConfig));
  }
  return result;
}

static void bta2dp_connection_state_callback(const RawAddress& bd_addr,
                                             btav_connection_state_t state) {
  ALOGI("%s", __func__);
  std::shared_lock<std::shared_timed_mutex> lock(callbacks_mutex);
  if (sCallbacks == nullptr) {
    ALOGE("%s: callbacks not registered", __func__);
    return;
  }

  sCallbacks->OnConnectionStateChanged(BtAddress(bd_addr.address),
                                       static_cast<int>(state));
}

static void bta2dp_audio_state_callback(const RawAddress& bd_addr,
                                        btav_audio_state_t state) {
  ALOGI("%s", __func__);
  std::shared_lock<std::shared_timed_mutex> lock(callbacks_mutex);
  if (sCallbacks == nullptr) {
    ALOGE("%s: callbacks not registered", __func__);
    return;
  }

  sCallbacks->OnAudioStateChanged(BtAddress(bd_addr.address),
                                  static_cast<int>(state));
}

static void bta2dp_audio_config_callback(
    const RawAddress& bd_addr, btav_a2dp_codec_config_t codec_config,
    std::vector<btav_a2dp_codec_config_t> codecs_local_capabilities,
    std::vector<btav_a2dp_codec_config_t> codecs_selectable_capabilities) {
  ALOGI("%s", __func__);
  std::shared_lock<std::shared_timed_mutex> lock(callbacks_mutex);
  if (sCallbacks == nullptr) {
    ALOGE("%s: callbacks not registered", __func__);
    return;
  }

  sCallbacks->OnCodecConfigChanged(
      BtAddress(bd_addr.address), FromBtavCodecConfig(codec_config),
      FromBtavCodecConfigs(codecs_local_capabilities),
      FromBtavCodecConfigs(codecs_selectable_capabilities));
}

static bool bta2dp_mandatory_codec_preferred_callback(
    const RawAddress& bd_addr) {
  ALOGI("%s", __func__);
  std::shared_lock<std::shared_timed_mutex> lock(callbacks_mutex);
  if (sCallbacks == nullptr) {
    ALOGE("%s: callbacks not registered", __func__);
    return false;
  }

  return sCallbacks->IsMandatoryCodecPreferred(BtAddress(bd_addr.address));
}

static btav_source_callbacks_t sBluetoothA2dpCallbacks = {
    sizeof(sBluetoothA2dpCallbacks),
    bta2dp_connection_state_callback,
    bta2dp_audio_state_callback,
    bta2dp_audio_config_callback,
    bta2dp_mandatory_codec_preferred_callback,
};

BtifA2dpNativeStack::BtifA2dpNativeStack(const bt_interface_t* btInterface)
    : mBtInterface(btInterface) {}

BtifA2dpNativeStack::~BtifA2dpNativeStack() {
  std::unique_lock<std::shared_timed_mutex> interface_lock(interface_mutex);
  std::unique_lock<std::shared_timed_mutex> callbacks_lock(callbacks_mutex);

  // Only the instance that initialized the profile may tear it down.
  if (sOwner != this) return;

  ReleaseProfile();
}

void BtifA2dpNativeStack::ReleaseProfile() {
  if (sBluetoothA2dpInterface != nullptr) {
    sBluetoothA2dpInterface->cleanup();
    sBluetoothA2dpInterface = nullptr;
  }

  sCallbacks = nullptr;
  sOwner = nullptr;
}

void BtifA2dpNativeStack::Init(
    A2dpNativeCallbacks* callbacks, int maxConnectedAudioDevices,
    const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
    const std::vector<BluetoothCodecConfig>& codecConfigOffload) {
  std::unique_lock<std::shared_timed_mutex> interface_lock(interface_mutex);
  std::unique_lock<std::shared_timed_mutex> callbacks_lock(callbacks_mutex);

  if (mBtInterface == nullptr) {
    ALOGE("Bluetooth module is not loaded");
    return;
  }

  if (sBluetoothA2dpInterface != nullptr) {
    ALOGW("Cleaning up A2DP Interface before initializing...");
    sBluetoothA2dpInterface->cleanup();
    sBluetoothA2dpInterface = nullptr;
  }

  if (sCallbacks != nullptr) {
    ALOGW("Cleaning up A2DP callback object");
    sCallbacks = nullptr;
  }
  sOwner = nullptr;

  if (callbacks == nullptr) {
    ALOGE("Failed to register A2DP callbacks: none given");
    return;
  }

  sBluetoothA2dpInterface =
      (const btav_source_interface_t*)mBtInterface->get_profile_interface(
          BT_PROFILE_ADVANCED_AUDIO_ID);
  if (sBluetoothA2dpInterface == nullptr) {
    ALOGE("Failed to get Bluetooth A2DP Interface");
    return;
  }

  sCallbacks = callbacks;
  std::vector<btav_a2dp_codec_config_t> codec_priorities =
      ToBtavCodecConfigs(codecConfigPriorities);
  std::vector<btav_a2dp_codec_config_t> codec_offloading =
      ToBtavCodecConfigs(codecConfigOffload);

  bt_status_t status = sBluetoothA2dpInterface->init(
      &sBluetoothA2dpCallbacks, maxConnectedAudioDevices, codec_priorities,
      codec_offloading);
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed to initialize Bluetooth A2DP, status: %d", status);
    sBluetoothA2dpInterface = nullptr;
    sCallbacks = nullptr;
    return;
  }
  sOwner = this;
}

void BtifA2dpNativeStack::Cleanup() {
  std::unique_lock<std::shared_timed_mutex> interface_lock(interface_mutex);
  std::unique_lock<std::shared_timed_mutex> callbacks_lock(callbacks_mutex);

  if (mBtInterface == nullptr) {
    ALOGE("Bluetooth module is not loaded");
    return;
  }

  ReleaseProfile();
}

bool BtifA2dpNativeStack::Connect(const BtAddress& address) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  ALOGI("%s: sBluetoothA2dpInterface: %p", __func__, sBluetoothA2dpInterface);
  if (!sBluetoothA2dpInterface) {
    ALOGE("%s: Failed to get the Bluetooth A2DP Interface", __func__);
    return false;
  }

  bt_status_t status = sBluetoothA2dpInterface->connect(ToRawAddress(address));
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed A2DP connection, status: %d", status);
  }
  return status == BT_STATUS_SUCCESS;
}

bool BtifA2dpNativeStack::Disconnect(const BtAddress& address) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  ALOGI("%s: sBluetoothA2dpInterface: %p", __func__, sBluetoothA2dpInterface);
  if (!sBluetoothA2dpInterface) {
    ALOGE("%s: Failed to get the Bluetooth A2DP Interface", __func__);
    return false;
  }

  bt_status_t status =
      sBluetoothA2dpInterface->disconnect(ToRawAddress(address));
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed A2DP disconnection, status: %d", status);
  }
  return status == BT_STATUS_SUCCESS;
}

bool BtifA2dpNativeStack::SetSilenceDevice(const BtAddress& address,
                                           bool silence) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  ALOGI("%s: sBluetoothA2dpInterface: %p", __func__, sBluetoothA2dpInterface);
  if (!sBluetoothA2dpInterface) {
    ALOGE("%s: Failed to get the Bluetooth A2DP Interface", __func__);
    return false;
  }

  bt_status_t status = sBluetoothA2dpInterface->set_silence_device(
      ToRawAddress(address), silence);
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed A2DP set_silence_device, status: %d", status);
  }
  return status == BT_STATUS_SUCCESS;
}

bool BtifA2dpNativeStack::SetActiveDevice(const BtAddress& address) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  ALOGI("%s: sBluetoothA2dpInterface: %p", __func__, sBluetoothA2dpInterface);
  if (!sBluetoothA2dpInterface) {
    ALOGE("%s: Failed to get the Bluetooth A2DP Interface", __func__);
    return false;
  }

  bt_status_t status =
      sBluetoothA2dpInterface->set_active_device(ToRawAddress(address));
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed A2DP set_active_device, status: %d", status);
  }
  return status == BT_STATUS_SUCCESS;
}

bool BtifA2dpNativeStack::SetCodecConfigPreference(
    const BtAddress& address,
    const std::vector<BluetoothCodecConfig>& codecConfigArray) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  ALOGI("%s: sBluetoothA2dpInterface: %p", __func__, sBluetoothA2dpInterface);
  if (!sBluetoothA2dpInterface) {
    ALOGE("%s: Failed to get the Bluetooth A2DP Interface", __func__);
    return false;
  }

  std::vector<btav_a2dp_codec_config_t> codec_preferences =
      ToBtavCodecConfigs(codecConfigArray);

  bt_status_t status = sBluetoothA2dpInterface->config_codec(
      ToRawAddress(address), codec_preferences);
  if (status != BT_STATUS_SUCCESS) {
    ALOGE("Failed codec configuration, status: %d", status);
  }
  return status == BT_STATUS_SUCCESS;
}

// The stock A2DP source profile has no LHDC extension entry points.

int BtifA2dpNativeStack::GetLhdcCodecExtendApiVer(
    const BtAddress& address, std::vector<uint8_t>& exApiVer) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  if (!sBluetoothA2dpInterface) return BT_STATUS_NOT_READY;

  ALOGW("%s: LHDC extension not supported, %s", __func__,
        address.ToString().c_str());
  return BT_STATUS_UNSUPPORTED;
}

int BtifA2dpNativeStack::SetLhdcCodecExtendApiConfig(
    const BtAddress& address, std::vector<uint8_t>& codecConfig) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  if (!sBluetoothA2dpInterface) return BT_STATUS_NOT_READY;

  ALOGW("%s: LHDC extension not supported, %s", __func__,
        address.ToString().c_str());
  return BT_STATUS_UNSUPPORTED;
}

int BtifA2dpNativeStack::GetLhdcCodecExtendApiConfig(
    const BtAddress& address, std::vector<uint8_t>& codecConfig) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  if (!sBluetoothA2dpInterface) return BT_STATUS_NOT_READY;

  ALOGW("%s: LHDC extension not supported, %s", __func__,
        address.ToString().c_str());
  return BT_STATUS_UNSUPPORTED;
}

int BtifA2dpNativeStack::GetLhdcCodecExtendApiA2dpCodecConfig(
    const BtAddress& address, std::vector<uint8_t>& codecConfig) {
  std::shared_lock<std::shared_timed_mutex> lock(interface_mutex);
  if (!sBluetoothA2dpInterface) return BT_STATUS_NOT_READY;

  ALOGW("%s: LHDC extension not supported, %s", __func__,
        address.ToString().c_str());
  return BT_STATUS_UNSUPPORTED;
}

void BtifA2dpNativeStack::SetLhdcCodecExtendApiData(
    const BtAddress& address, std::vector<uint8_t>& codecData) {
  ALOGW("%s: LHDC extension not supported, dropping %zu bytes for %s",
        __func__, codecData.size(), address.ToString().c_str());
}

}  // namespace a2dp_bridge
