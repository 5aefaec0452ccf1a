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

#ifndef A2DP_BRIDGE_A2DP_STACK_EVENT_H
#define A2DP_BRIDGE_A2DP_STACK_EVENT_H

#include <optional>
#include <string>

#include "bluetooth_codec_status.h"
#include "bluetooth_device.h"

namespace a2dp_bridge {

/** Notification from the native stack, as delivered to the A2DP service.
 *
 * Connection and audio state events carry an integer state; codec config
 * events carry a codec status. Events are built once per callback and never
 * modified afterwards.
 */
class A2dpStackEvent {
 public:
  enum EventType {
    EVENT_TYPE_NONE = 0,
    EVENT_TYPE_CONNECTION_STATE_CHANGED = 1,
    EVENT_TYPE_AUDIO_STATE_CHANGED = 2,
    EVENT_TYPE_CODEC_CONFIG_CHANGED = 3,
  };

  // Match btav_connection_state_t.
  static constexpr int CONNECTION_STATE_DISCONNECTED = 0;
  static constexpr int CONNECTION_STATE_CONNECTING = 1;
  static constexpr int CONNECTION_STATE_CONNECTED = 2;
  static constexpr int CONNECTION_STATE_DISCONNECTING = 3;

  // Match btav_audio_state_t.
  static constexpr int AUDIO_STATE_REMOTE_SUSPEND = 0;
  static constexpr int AUDIO_STATE_STOPPED = 1;
  static constexpr int AUDIO_STATE_STARTED = 2;

  static A2dpStackEvent ConnectionStateChanged(const BluetoothDevice& device,
                                               int state);
  static A2dpStackEvent AudioStateChanged(const BluetoothDevice& device,
                                          int state);
  static A2dpStackEvent CodecConfigChanged(
      const BluetoothDevice& device, const BluetoothCodecStatus& codecStatus);

  EventType GetType() const { return mType; }
  const BluetoothDevice& GetDevice() const { return mDevice; }
  // State for connection and audio events, 0 otherwise.
  int GetValueInt() const { return mValueInt; }
  // Set for codec config events only.
  const std::optional<BluetoothCodecStatus>& GetCodecStatus() const {
    return mCodecStatus;
  }

  std::string ToString() const;

  static std::string EventTypeToString(int type);
  static std::string ConnectionStateToString(int state);
  static std::string AudioStateToString(int state);

 private:
  A2dpStackEvent(EventType type, const BluetoothDevice& device, int valueInt,
                 const std::optional<BluetoothCodecStatus>& codecStatus)
      : mType(type),
        mDevice(device),
        mValueInt(valueInt),
        mCodecStatus(codecStatus) {}

  EventType mType;
  BluetoothDevice mDevice;
  int mValueInt;
  std::optional<BluetoothCodecStatus> mCodecStatus;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_A2DP_STACK_EVENT_H
