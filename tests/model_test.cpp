#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "tradfri_light.h"
#include "tradfri_model.h"

using namespace tradfri;

// ===========================================================================
// Color normalization
// ===========================================================================

TEST(NormalizeColorTest, RgbAcceptsHexWithOrWithoutHash)
{
    EXPECT_EQ(normalizeColor(Spectrum::Rgb, QStringLiteral("#FF00aa")), QStringLiteral("ff00aa"));
    EXPECT_EQ(normalizeColor(Spectrum::Rgb, QStringLiteral("0A0b0C")), QStringLiteral("0a0b0c"));
    EXPECT_EQ(normalizeColor(Spectrum::Rgb, QStringLiteral("  abcdef ")), QStringLiteral("abcdef"));
}

TEST(NormalizeColorTest, RgbRejectsMalformedHex)
{
    QString error;
    EXPECT_TRUE(normalizeColor(Spectrum::Rgb, QStringLiteral("12345"), &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
    EXPECT_TRUE(normalizeColor(Spectrum::Rgb, QStringLiteral("gg0000")).isEmpty());
    EXPECT_TRUE(normalizeColor(Spectrum::Rgb, QStringLiteral("ff00001")).isEmpty());
}

TEST(NormalizeColorTest, WhiteAcceptsPaletteHexAndNames)
{
    EXPECT_EQ(normalizeColor(Spectrum::White, QStringLiteral("F5FAF6")), QStringLiteral("f5faf6"));
    EXPECT_EQ(normalizeColor(Spectrum::White, QStringLiteral("warm")), QStringLiteral("f1e0b5"));
    EXPECT_EQ(normalizeColor(Spectrum::White, QStringLiteral("#efd275")), QStringLiteral("efd275"));
}

TEST(NormalizeColorTest, WhiteRejectsColorsOutsidePalette)
{
    QString error;
    EXPECT_TRUE(normalizeColor(Spectrum::White, QStringLiteral("ff0000"), &error).isEmpty());
    EXPECT_TRUE(error.contains(QStringLiteral("palette")));
}

TEST(NormalizeColorTest, NoneSpectrumRejectsEveryColor)
{
    QString error;
    EXPECT_TRUE(normalizeColor(Spectrum::None, QStringLiteral("f5faf6"), &error).isEmpty());
    EXPECT_EQ(error, QStringLiteral("Light does not support colors"));
}

TEST(WhitePaletteTest, HasThreeEntries)
{
    const auto palette = whitePalette();
    ASSERT_EQ(palette.size(), 3);
    EXPECT_STREQ(palette.at(0).hex, "f5faf6");
    EXPECT_STREQ(palette.at(1).hex, "f1e0b5");
    EXPECT_STREQ(palette.at(2).hex, "efd275");
}

// ===========================================================================
// Operation validation
// ===========================================================================

TEST(ValidateOperationTest, RejectsEmptyAndNullOperations)
{
    LightOperation empty;
    EXPECT_TRUE(empty.isEmpty());
    EXPECT_FALSE(validateOperation(Spectrum::Rgb, &empty));
    EXPECT_FALSE(validateOperation(Spectrum::Rgb, nullptr));
}

TEST(ValidateOperationTest, BrightnessMustBeWithinRange)
{
    LightOperation operation;
    operation.brightness = 0.0;
    EXPECT_TRUE(validateOperation(Spectrum::None, &operation));
    operation.brightness = 100.0;
    EXPECT_TRUE(validateOperation(Spectrum::None, &operation));

    operation.brightness = 100.5;
    EXPECT_FALSE(validateOperation(Spectrum::None, &operation));
    operation.brightness = -1.0;
    EXPECT_FALSE(validateOperation(Spectrum::None, &operation));
    operation.brightness = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(validateOperation(Spectrum::None, &operation));
}

TEST(ValidateOperationTest, RejectsNegativeTransition)
{
    LightOperation operation;
    operation.onOff = true;
    operation.transitionTimeMs = -10;
    QString error;
    EXPECT_FALSE(validateOperation(Spectrum::White, &operation, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(ValidateOperationTest, NormalizesColorInPlace)
{
    LightOperation operation;
    operation.color = QStringLiteral("#ABCDEF");
    ASSERT_TRUE(validateOperation(Spectrum::Rgb, &operation));
    EXPECT_EQ(*operation.color, QStringLiteral("abcdef"));

    LightOperation white;
    white.color = QStringLiteral("Yellow");
    ASSERT_TRUE(validateOperation(Spectrum::White, &white));
    EXPECT_EQ(*white.color, QStringLiteral("efd275"));
}

// ===========================================================================
// LightState
// ===========================================================================

TEST(LightStateTest, ApplySetsOnlyPresentFields)
{
    LightState state;
    state.spectrum = Spectrum::Rgb;
    state.hasBrightness = true;
    state.brightness = 20.0;

    LightOperation operation;
    operation.onOff = true;
    operation.color = QStringLiteral("ff0000");
    state.apply(operation);

    EXPECT_TRUE(state.hasOn);
    EXPECT_TRUE(state.on);
    EXPECT_TRUE(state.hasColor);
    EXPECT_EQ(state.color, QStringLiteral("ff0000"));
    EXPECT_DOUBLE_EQ(state.brightness, 20.0);
}

TEST(LightStateTest, MergeOverwritesWithOtherFields)
{
    LightState working;
    working.spectrum = Spectrum::Rgb;
    working.hasOn = true;
    working.on = false;
    working.hasColor = true;
    working.color = QStringLiteral("ff0000");
    working.hasBrightness = true;
    working.brightness = 100.0;

    LightState snapshot;
    snapshot.spectrum = Spectrum::Rgb;
    snapshot.hasOn = true;
    snapshot.on = true;
    snapshot.hasBrightness = true;
    snapshot.brightness = 35.0;

    working.merge(snapshot);
    EXPECT_TRUE(working.on);
    EXPECT_DOUBLE_EQ(working.brightness, 35.0);
    // Not captured in the snapshot, left as is.
    EXPECT_EQ(working.color, QStringLiteral("ff0000"));
}

TEST(LightStateTest, EqualityIgnoresValuesOfAbsentFields)
{
    LightState a;
    LightState b;
    b.on = true;
    EXPECT_EQ(a, b);
    b.hasOn = true;
    EXPECT_NE(a, b);
}

// ===========================================================================
// Identity
// ===========================================================================

TEST(GatewayIdentityTest, SerializesToCompactJson)
{
    GatewayIdentity identity {QStringLiteral("client-1"), QStringLiteral("s3cret")};
    EXPECT_EQ(identity.serialize(), QByteArray("{\"identity\":\"client-1\",\"psk\":\"s3cret\"}"));

    const auto parsed = GatewayIdentity::deserialize(identity.serialize());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->identity, identity.identity);
    EXPECT_EQ(parsed->psk, identity.psk);
}

TEST(GatewayIdentityTest, RejectsMalformedOrIncompleteJson)
{
    QString error;
    EXPECT_FALSE(GatewayIdentity::deserialize("not json", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(GatewayIdentity::deserialize("{\"identity\":\"only\"}", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(GatewayIdentity::deserialize("[1,2]").has_value());
}

// ===========================================================================
// Names and results
// ===========================================================================

TEST(StatusTest, EveryStatusHasNameAndMessage)
{
    const Status all[] = {Status::Success, Status::DiscoveryFailed, Status::ConnectionFailed,
                          Status::AuthenticationFailed, Status::NotAuthenticated,
                          Status::DeviceCommandError, Status::InvalidArgument, Status::NotFound};
    for (Status status : all) {
        EXPECT_FALSE(statusName(status).isEmpty());
        EXPECT_FALSE(statusMessage(status).isEmpty());
    }
    EXPECT_TRUE(statusMessage(Status::NotAuthenticated).contains(QStringLiteral("connect")));
}

TEST(SpectrumTest, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(spectrumFromString(QStringLiteral("RGB")), Spectrum::Rgb);
    EXPECT_EQ(spectrumFromString(QStringLiteral(" white ")), Spectrum::White);
    EXPECT_EQ(spectrumFromString(QStringLiteral("bogus")), Spectrum::None);
    EXPECT_EQ(spectrumName(Spectrum::Rgb), QStringLiteral("rgb"));
}

TEST(BatchResultTest, CountsFailures)
{
    BatchResult batch;
    EXPECT_TRUE(batch.allSucceeded());

    LightOutcome good;
    good.result.ok = true;
    LightOutcome bad;
    bad.result.status = Status::NotFound;
    batch.outcomes = {good, bad, good};

    EXPECT_FALSE(batch.allSucceeded());
    EXPECT_EQ(batch.failureCount(), 1);
}

TEST(LightInfoTest, DisplayLineShowsNameIdAndSpectrum)
{
    LightInfo info;
    info.deviceId = 65537;
    info.name = QStringLiteral("Kitchen");
    info.spectrum = Spectrum::White;
    EXPECT_EQ(info.displayLine(), QStringLiteral("Kitchen (#65537) - white"));
}
