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

#include "a2dp_stack_event.h"

namespace a2dp_bridge {

A2dpStackEvent A2dpStackEvent::ConnectionStateChanged(
    const BluetoothDevice& device, int state) {
  return A2dpStackEvent(EVENT_TYPE_CONNECTION_STATE_CHANGED, device, state,
                        std::nullopt);
}

A2dpStackEvent A2dpStackEvent::AudioStateChanged(const BluetoothDevice& device,
                                                 int state) {
  return A2dpStackEvent(EVENT_TYPE_AUDIO_STATE_CHANGED, device, state,
                        std::nullopt);
}

A2dpStackEvent A2dpStackEvent::CodecConfigChanged(
    const BluetoothDevice& device, const BluetoothCodecStatus& codecStatus) {
  return A2dpStackEvent(EVENT_TYPE_CODEC_CONFIG_CHANGED, device, 0,
                        codecStatus);
}

std::string A2dpStackEvent::ToString() const {
  std::string result = "A2dpStackEvent {type:" + EventTypeToString(mType);
  result += ", device:" + mDevice.GetAddress();
  switch (mType) {
    case EVENT_TYPE_CONNECTION_STATE_CHANGED:
      result += ", value1:" + ConnectionStateToString(mValueInt);
      break;
    case EVENT_TYPE_AUDIO_STATE_CHANGED:
      result += ", value1:" + AudioStateToString(mValueInt);
      break;
    default:
      result += ", value1:" + std::to_string(mValueInt);
      break;
  }
  if (mCodecStatus) {
    result += ", codecStatus:" + mCodecStatus->ToString();
  }
  result += "}";
  return result;
}

std::string A2dpStackEvent::EventTypeToString(int type) {
  switch (type) {
    case EVENT_TYPE_NONE:
      return "EVENT_TYPE_NONE";
    case EVENT_TYPE_CONNECTION_STATE_CHANGED:
      return "EVENT_TYPE_CONNECTION_STATE_CHANGED";
    case EVENT_TYPE_AUDIO_STATE_CHANGED:
      return "EVENT_TYPE_AUDIO_STATE_CHANGED";
    case EVENT_TYPE_CODEC_CONFIG_CHANGED:
      return "EVENT_TYPE_CODEC_CONFIG_CHANGED";
    default:
      return "EVENT_TYPE_UNKNOWN:" + std::to_string(type);
  }
}

std::string A2dpStackEvent::ConnectionStateToString(int state) {
  switch (state) {
    case CONNECTION_STATE_DISCONNECTED:
      return "DISCONNECTED";
    case CONNECTION_STATE_CONNECTING:
      return "CONNECTING";
    case CONNECTION_STATE_CONNECTED:
      return "CONNECTED";
    case CONNECTION_STATE_DISCONNECTING:
      return "DISCONNECTING";
    default:
      return "UNKNOWN(" + std::to_string(state) + ")";
  }
}

std::string A2dpStackEvent::AudioStateToString(int state) {
  switch (state) {
    case AUDIO_STATE_REMOTE_SUSPEND:
      return "REMOTE_SUSPEND";
    case AUDIO_STATE_STOPPED:
      return "STOPPED";
    case AUDIO_STATE_STARTED:
      return "STARTED";
    default:
      return "UNKNOWN(" + std::to_string(state) + ")";
  }
}

}  // namespace a2dp_bridge
