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

#ifndef A2DP_BRIDGE_BLUETOOTH_CODEC_CONFIG_H
#define A2DP_BRIDGE_BLUETOOTH_CODEC_CONFIG_H

#include <stdint.h>

#include <string>

namespace a2dp_bridge {

/** One A2DP codec configuration: the codec, its priority and the audio
 * feeding parameters. Sample rate, bits per sample and channel mode are bit
 * masks so that capability lists can carry several values at once.
 */
class BluetoothCodecConfig {
 public:
  static constexpr int32_t SOURCE_CODEC_TYPE_SBC = 0;
  static constexpr int32_t SOURCE_CODEC_TYPE_AAC = 1;
  static constexpr int32_t SOURCE_CODEC_TYPE_APTX = 2;
  static constexpr int32_t SOURCE_CODEC_TYPE_APTX_HD = 3;
  static constexpr int32_t SOURCE_CODEC_TYPE_LDAC = 4;
  static constexpr int32_t SOURCE_CODEC_TYPE_LHDCV2 = 5;
  static constexpr int32_t SOURCE_CODEC_TYPE_LHDCV3 = 6;
  static constexpr int32_t SOURCE_CODEC_TYPE_LHDCV5 = 7;
  static constexpr int32_t SOURCE_CODEC_TYPE_LLAC = 8;
  static constexpr int32_t SOURCE_CODEC_TYPE_INVALID = 1000 * 1000;

  static constexpr int32_t CODEC_PRIORITY_DISABLED = -1;
  static constexpr int32_t CODEC_PRIORITY_DEFAULT = 0;
  static constexpr int32_t CODEC_PRIORITY_HIGHEST = 1000 * 1000;

  static constexpr int32_t SAMPLE_RATE_NONE = 0;
  static constexpr int32_t SAMPLE_RATE_44100 = 0x1 << 0;
  static constexpr int32_t SAMPLE_RATE_48000 = 0x1 << 1;
  static constexpr int32_t SAMPLE_RATE_88200 = 0x1 << 2;
  static constexpr int32_t SAMPLE_RATE_96000 = 0x1 << 3;
  static constexpr int32_t SAMPLE_RATE_176400 = 0x1 << 4;
  static constexpr int32_t SAMPLE_RATE_192000 = 0x1 << 5;

  static constexpr int32_t BITS_PER_SAMPLE_NONE = 0;
  static constexpr int32_t BITS_PER_SAMPLE_16 = 0x1 << 0;
  static constexpr int32_t BITS_PER_SAMPLE_24 = 0x1 << 1;
  static constexpr int32_t BITS_PER_SAMPLE_32 = 0x1 << 2;

  static constexpr int32_t CHANNEL_MODE_NONE = 0;
  static constexpr int32_t CHANNEL_MODE_MONO = 0x1 << 0;
  static constexpr int32_t CHANNEL_MODE_STEREO = 0x1 << 1;

  BluetoothCodecConfig(int32_t codecType, int32_t codecPriority,
                       int32_t sampleRate, int32_t bitsPerSample,
                       int32_t channelMode, int64_t codecSpecific1,
                       int64_t codecSpecific2, int64_t codecSpecific3,
                       int64_t codecSpecific4);
  // Default priority, no feeding parameters.
  explicit BluetoothCodecConfig(int32_t codecType);

  int32_t GetCodecType() const { return mCodecType; }
  int32_t GetCodecPriority() const { return mCodecPriority; }
  int32_t GetSampleRate() const { return mSampleRate; }
  int32_t GetBitsPerSample() const { return mBitsPerSample; }
  int32_t GetChannelMode() const { return mChannelMode; }
  int64_t GetCodecSpecific1() const { return mCodecSpecific1; }
  int64_t GetCodecSpecific2() const { return mCodecSpecific2; }
  int64_t GetCodecSpecific3() const { return mCodecSpecific3; }
  int64_t GetCodecSpecific4() const { return mCodecSpecific4; }

  bool IsValid() const;

  // SBC is the only codec every A2DP sink must support.
  bool IsMandatoryCodec() const {
    return mCodecType == SOURCE_CODEC_TYPE_SBC;
  }

  std::string GetCodecName() const;
  static std::string GetCodecName(int32_t codecType);

  std::string ToString() const;

  bool operator==(const BluetoothCodecConfig& rhs) const;
  bool operator!=(const BluetoothCodecConfig& rhs) const {
    return !(*this == rhs);
  }

 private:
  int32_t mCodecType;
  int32_t mCodecPriority;
  int32_t mSampleRate;
  int32_t mBitsPerSample;
  int32_t mChannelMode;
  int64_t mCodecSpecific1;
  int64_t mCodecSpecific2;
  int64_t mCodecSpecific3;
  int64_t mCodecSpecific4;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_BLUETOOTH_CODEC_CONFIG_H
