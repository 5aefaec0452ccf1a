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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdint.h>

#include <string>

#include "bluetooth_codec_status.h"

namespace a2dp_bridge {
namespace {

using ::testing::HasSubstr;

BluetoothCodecConfig MakeConfig(int32_t codecType, int32_t sampleRate,
                                int32_t bitsPerSample, int32_t channelMode) {
  return BluetoothCodecConfig(codecType,
                              BluetoothCodecConfig::CODEC_PRIORITY_DEFAULT,
                              sampleRate, bitsPerSample, channelMode, 0, 0, 0,
                              0);
}

TEST(BluetoothCodecConfigTest, CodecNames) {
  EXPECT_EQ("SBC", BluetoothCodecConfig::GetCodecName(
                       BluetoothCodecConfig::SOURCE_CODEC_TYPE_SBC));
  EXPECT_EQ("aptX HD", BluetoothCodecConfig::GetCodecName(
                           BluetoothCodecConfig::SOURCE_CODEC_TYPE_APTX_HD));
  EXPECT_EQ("LHDC V3", BluetoothCodecConfig::GetCodecName(
                           BluetoothCodecConfig::SOURCE_CODEC_TYPE_LHDCV3));
  EXPECT_EQ("INVALID CODEC",
            BluetoothCodecConfig::GetCodecName(
                BluetoothCodecConfig::SOURCE_CODEC_TYPE_INVALID));
  EXPECT_EQ("UNKNOWN CODEC(77)", BluetoothCodecConfig::GetCodecName(77));
}

TEST(BluetoothCodecConfigTest, OnlySbcIsMandatory) {
  EXPECT_TRUE(BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_SBC)
                  .IsMandatoryCodec());
  EXPECT_FALSE(BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC)
                   .IsMandatoryCodec());
  EXPECT_FALSE(
      BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LHDCV5)
          .IsMandatoryCodec());
}

TEST(BluetoothCodecConfigTest, Validity) {
  EXPECT_TRUE(
      BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LLAC)
          .IsValid());
  EXPECT_FALSE(
      BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_INVALID)
          .IsValid());
  EXPECT_FALSE(BluetoothCodecConfig(-1).IsValid());
}

TEST(BluetoothCodecConfigTest, EqualityCoversCodecSpecificValues) {
  BluetoothCodecConfig a(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC, 0, 0,
                         0, 0, 1001, 0, 0, 0);
  BluetoothCodecConfig b(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC, 0, 0,
                         0, 0, 1003, 0, 0, 0);
  EXPECT_NE(a, b);
  EXPECT_EQ(a, BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC,
                                    0, 0, 0, 0, 1001, 0, 0, 0));
}

TEST(BluetoothCodecConfigTest, ToStringNamesFeedingParameters) {
  BluetoothCodecConfig config = MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC,
      BluetoothCodecConfig::SAMPLE_RATE_44100 |
          BluetoothCodecConfig::SAMPLE_RATE_48000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_16,
      BluetoothCodecConfig::CHANNEL_MODE_NONE);
  std::string text = config.ToString();

  EXPECT_THAT(text, HasSubstr("codecName:AAC"));
  EXPECT_THAT(text, HasSubstr("mSampleRate:0x3(44100|48000)"));
  EXPECT_THAT(text, HasSubstr("mBitsPerSample:0x1(16)"));
  EXPECT_THAT(text, HasSubstr("mChannelMode:0x0(NONE)"));
  EXPECT_THAT(text, HasSubstr("mCodecSpecific4:0"));
}

TEST(BluetoothCodecConfigTest, ToStringKeepsExtremeCodecSpecificValues) {
  BluetoothCodecConfig config(BluetoothCodecConfig::SOURCE_CODEC_TYPE_LHDCV5,
                              BluetoothCodecConfig::CODEC_PRIORITY_DEFAULT,
                              BluetoothCodecConfig::SAMPLE_RATE_48000,
                              BluetoothCodecConfig::BITS_PER_SAMPLE_24,
                              BluetoothCodecConfig::CHANNEL_MODE_STEREO,
                              INT64_MIN, INT64_MIN, INT64_MIN, INT64_MIN);
  std::string text = config.ToString();

  EXPECT_THAT(text, HasSubstr("mCodecSpecific1:-9223372036854775808,"));
  EXPECT_THAT(text, HasSubstr("mCodecSpecific2:-9223372036854775808,"));
  EXPECT_THAT(text, HasSubstr("mCodecSpecific3:-9223372036854775808,"));
  EXPECT_THAT(text, HasSubstr("mCodecSpecific4:-9223372036854775808}"));
}

TEST(BluetoothCodecStatusTest, HighBitFeedingParameterIsASingleBit) {
  BluetoothCodecConfig high_rate = MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC, INT32_MIN,
      BluetoothCodecConfig::BITS_PER_SAMPLE_24,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO);
  BluetoothCodecConfig caps = MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC,
      INT32_MIN | BluetoothCodecConfig::SAMPLE_RATE_48000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_24,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO);

  EXPECT_TRUE(BluetoothCodecStatus(caps, {caps}, {caps})
                  .IsCodecConfigSelectable(high_rate));
  // Bit 31 plus another rate is still more than one bit.
  EXPECT_FALSE(BluetoothCodecStatus(caps, {caps}, {caps})
                   .IsCodecConfigSelectable(caps));

  BluetoothCodecConfig low_caps = MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_LDAC,
      BluetoothCodecConfig::SAMPLE_RATE_48000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_24,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO);
  EXPECT_FALSE(BluetoothCodecStatus(low_caps, {low_caps}, {low_caps})
                   .IsCodecConfigSelectable(high_rate));
}

TEST(BluetoothCodecStatusTest, SelectableConfigMustMatchCapability) {
  BluetoothCodecConfig aac_caps = MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC,
      BluetoothCodecConfig::SAMPLE_RATE_44100 |
          BluetoothCodecConfig::SAMPLE_RATE_48000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_16,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO);
  BluetoothCodecStatus status(aac_caps, {aac_caps}, {aac_caps});

  EXPECT_TRUE(status.IsCodecConfigSelectable(MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC,
      BluetoothCodecConfig::SAMPLE_RATE_48000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_16,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO)));
  // Unset parameters are left to the stack.
  EXPECT_TRUE(status.IsCodecConfigSelectable(
      BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC)));
  EXPECT_FALSE(status.IsCodecConfigSelectable(MakeConfig(
      BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC,
      BluetoothCodecConfig::SAMPLE_RATE_96000,
      BluetoothCodecConfig::BITS_PER_SAMPLE_16,
      BluetoothCodecConfig::CHANNEL_MODE_STEREO)));
  // More than one sample rate is a capability, not a configuration.
  EXPECT_FALSE(status.IsCodecConfigSelectable(aac_caps));
  EXPECT_FALSE(status.IsCodecConfigSelectable(
      BluetoothCodecConfig(BluetoothCodecConfig::SOURCE_CODEC_TYPE_SBC)));
}

TEST(BluetoothCodecStatusTest, EqualityComparesAllLists) {
  BluetoothCodecConfig sbc(BluetoothCodecConfig::SOURCE_CODEC_TYPE_SBC);
  BluetoothCodecConfig aac(BluetoothCodecConfig::SOURCE_CODEC_TYPE_AAC);

  EXPECT_EQ(BluetoothCodecStatus(sbc, {sbc, aac}, {sbc}),
            BluetoothCodecStatus(sbc, {sbc, aac}, {sbc}));
  EXPECT_NE(BluetoothCodecStatus(sbc, {sbc, aac}, {sbc}),
            BluetoothCodecStatus(sbc, {aac, sbc}, {sbc}));
  EXPECT_NE(BluetoothCodecStatus(sbc, {sbc}, {sbc}),
            BluetoothCodecStatus(sbc, {sbc}, {}));
}

}  // namespace
}  // namespace a2dp_bridge
