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

#define LOG_TAG "A2dpBridgeConfig"

#include "a2dp_bridge_config.h"

#include <cutils/properties.h>

#include "utils/Log.h"

namespace a2dp_bridge {

A2dpBridgeConfig::A2dpBridgeConfig(int maxConnectedAudioDevices,
                                   bool offloadSupported, bool offloadDisabled)
    : mMaxConnectedAudioDevices(maxConnectedAudioDevices),
      mOffloadSupported(offloadSupported),
      mOffloadDisabled(offloadDisabled) {
  if (mMaxConnectedAudioDevices < 1) {
    ALOGW("%s: max connected audio devices %d raised to 1", __func__,
          maxConnectedAudioDevices);
    mMaxConnectedAudioDevices = 1;
  } else if (mMaxConnectedAudioDevices > kMaxConnectedAudioDevicesLimit) {
    ALOGW("%s: max connected audio devices %d capped to %d", __func__,
          maxConnectedAudioDevices, kMaxConnectedAudioDevicesLimit);
    mMaxConnectedAudioDevices = kMaxConnectedAudioDevicesLimit;
  }
}

A2dpBridgeConfig A2dpBridgeConfig::FromSystemProperties() {
  int32_t maxConnected = property_get_int32(kMaxConnectedAudioDevicesProperty,
                                            kDefaultMaxConnectedAudioDevices);
  bool offloadSupported =
      property_get_bool(kA2dpOffloadSupportedProperty, false);
  bool offloadDisabled = property_get_bool(kA2dpOffloadDisabledProperty, false);

  A2dpBridgeConfig config(maxConnected, offloadSupported, offloadDisabled);
  ALOGI("%s: %s", __func__, config.ToString().c_str());
  return config;
}

std::string A2dpBridgeConfig::ToString() const {
  return "{maxConnectedAudioDevices:" +
         std::to_string(mMaxConnectedAudioDevices) +
         ",offloadSupported:" + (mOffloadSupported ? "true" : "false") +
         ",offloadDisabled:" + (mOffloadDisabled ? "true" : "false") + "}";
}

}  // namespace a2dp_bridge
