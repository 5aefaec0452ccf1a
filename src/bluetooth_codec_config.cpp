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

#include "bluetooth_codec_config.h"

#include <stdio.h>

#include <utility>

namespace a2dp_bridge {

// Renders "0x<mask>(NAME|NAME)" for the bits of |mask| found in |names|.
template <size_t N>
static std::string MaskToString(int32_t mask,
                                const std::pair<int32_t, const char*> (&names)[N]) {
  char hex[16];
  snprintf(hex, sizeof(hex), "0x%x", static_cast<uint32_t>(mask));

  std::string result(hex);
  result += "(";
  if (mask == 0) {
    result += "NONE";
  } else {
    bool first = true;
    for (const auto& entry : names) {
      if ((mask & entry.first) == 0) continue;
      if (!first) result += "|";
      result += entry.second;
      first = false;
    }
  }
  result += ")";
  return result;
}

static const std::pair<int32_t, const char*> kSampleRateNames[] = {
    {BluetoothCodecConfig::SAMPLE_RATE_44100, "44100"},
    {BluetoothCodecConfig::SAMPLE_RATE_48000, "48000"},
    {BluetoothCodecConfig::SAMPLE_RATE_88200, "88200"},
    {BluetoothCodecConfig::SAMPLE_RATE_96000, "96000"},
    {BluetoothCodecConfig::SAMPLE_RATE_176400, "176400"},
    {BluetoothCodecConfig::SAMPLE_RATE_192000, "192000"},
};

static const std::pair<int32_t, const char*> kBitsPerSampleNames[] = {
    {BluetoothCodecConfig::BITS_PER_SAMPLE_16, "16"},
    {BluetoothCodecConfig::BITS_PER_SAMPLE_24, "24"},
    {BluetoothCodecConfig::BITS_PER_SAMPLE_32, "32"},
};

static const std::pair<int32_t, const char*> kChannelModeNames[] = {
    {BluetoothCodecConfig::CHANNEL_MODE_MONO, "MONO"},
    {BluetoothCodecConfig::CHANNEL_MODE_STEREO, "STEREO"},
};

BluetoothCodecConfig::BluetoothCodecConfig(
    int32_t codecType, int32_t codecPriority, int32_t sampleRate,
    int32_t bitsPerSample, int32_t channelMode, int64_t codecSpecific1,
    int64_t codecSpecific2, int64_t codecSpecific3, int64_t codecSpecific4)
    : mCodecType(codecType),
      mCodecPriority(codecPriority),
      mSampleRate(sampleRate),
      mBitsPerSample(bitsPerSample),
      mChannelMode(channelMode),
      mCodecSpecific1(codecSpecific1),
      mCodecSpecific2(codecSpecific2),
      mCodecSpecific3(codecSpecific3),
      mCodecSpecific4(codecSpecific4) {}

BluetoothCodecConfig::BluetoothCodecConfig(int32_t codecType)
    : BluetoothCodecConfig(codecType, CODEC_PRIORITY_DEFAULT, SAMPLE_RATE_NONE,
                           BITS_PER_SAMPLE_NONE, CHANNEL_MODE_NONE, 0, 0, 0,
                           0) {}

bool BluetoothCodecConfig::IsValid() const {
  return mCodecType >= SOURCE_CODEC_TYPE_SBC &&
         mCodecType <= SOURCE_CODEC_TYPE_LLAC;
}

std::string BluetoothCodecConfig::GetCodecName() const {
  return GetCodecName(mCodecType);
}

std::string BluetoothCodecConfig::GetCodecName(int32_t codecType) {
  switch (codecType) {
    case SOURCE_CODEC_TYPE_SBC:
      return "SBC";
    case SOURCE_CODEC_TYPE_AAC:
      return "AAC";
    case SOURCE_CODEC_TYPE_APTX:
      return "aptX";
    case SOURCE_CODEC_TYPE_APTX_HD:
      return "aptX HD";
    case SOURCE_CODEC_TYPE_LDAC:
      return "LDAC";
    case SOURCE_CODEC_TYPE_LHDCV2:
      return "LHDC V2";
    case SOURCE_CODEC_TYPE_LHDCV3:
      return "LHDC V3";
    case SOURCE_CODEC_TYPE_LHDCV5:
      return "LHDC V5";
    case SOURCE_CODEC_TYPE_LLAC:
      return "LLAC";
    case SOURCE_CODEC_TYPE_INVALID:
      return "INVALID CODEC";
    default:
      break;
  }
  return "UNKNOWN CODEC(" + std::to_string(codecType) + ")";
}

std::string BluetoothCodecConfig::ToString() const {
  return "{codecName:" + GetCodecName() +
         ",mCodecType:" + std::to_string(mCodecType) +
         ",mCodecPriority:" + std::to_string(mCodecPriority) +
         ",mSampleRate:" + MaskToString(mSampleRate, kSampleRateNames) +
         ",mBitsPerSample:" + MaskToString(mBitsPerSample, kBitsPerSampleNames) +
         ",mChannelMode:" + MaskToString(mChannelMode, kChannelModeNames) +
         ",mCodecSpecific1:" + std::to_string(mCodecSpecific1) +
         ",mCodecSpecific2:" + std::to_string(mCodecSpecific2) +
         ",mCodecSpecific3:" + std::to_string(mCodecSpecific3) +
         ",mCodecSpecific4:" + std::to_string(mCodecSpecific4) + "}";
}

bool BluetoothCodecConfig::operator==(const BluetoothCodecConfig& rhs) const {
  return mCodecType == rhs.mCodecType &&
         mCodecPriority == rhs.mCodecPriority &&
         mSampleRate == rhs.mSampleRate &&
         mBitsPerSample == rhs.mBitsPerSample &&
         mChannelMode == rhs.mChannelMode &&
         mCodecSpecific1 == rhs.mCodecSpecific1 &&
         mCodecSpecific2 == rhs.mCodecSpecific2 &&
         mCodecSpecific3 == rhs.mCodecSpecific3 &&
         mCodecSpecific4 == rhs.mCodecSpecific4;
}

}  // namespace a2dp_bridge
