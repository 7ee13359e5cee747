#include "assembly/part_validator.hpp"
#include "compression/huffman/codec.hpp"
#include "errors.hpp"
#include "partition/part_format.hpp"
#include "partition/partitioner.hpp"

#include <gtest/gtest.h>

#include <numeric>
#include <stdexcept>
#include <vector>

namespace {

using namespace auraseal::partition;
using auraseal::compression::huffman::CompressionResult;

CompressionResult syntheticStream(std::size_t compressedSize)
{
    CompressionResult encoded {};
    encoded.metadata.codeLengths.fill(8);
    encoded.metadata.originalSize = compressedSize;
    encoded.compressed.resize(compressedSize);
    std::iota(encoded.compressed.begin(), encoded.compressed.end(), static_cast<std::uint8_t>(0));
    return encoded;
}

auraseal::assembly::PartExpectation expectationFor(const Part& part)
{
    auraseal::assembly::PartExpectation expectation {};
    expectation.kind = part.header.kind;
    expectation.componentId = part.header.componentId;
    expectation.index = part.header.partNumber;
    expectation.totalParts = part.header.totalParts;
    expectation.fullSize = part.header.fullSize;
    return expectation;
}

} // namespace

TEST(PartitionerTest, SplitsNineThousandBytesIntoTwoParts)
{
    const auto encoded = syntheticStream(9000);
    const auto parts = split(encoded, 4, kMaxPartPayload, 1);

    ASSERT_EQ(parts.size(), 2U);
    EXPECT_EQ(parts[0].payload.size(), 5120U);
    EXPECT_EQ(parts[1].payload.size(), 3880U);
    for (std::size_t index = 0; index < parts.size(); ++index) {
        const auto& header = parts[index].header;
        EXPECT_EQ(header.partNumber, index);
        EXPECT_EQ(header.totalParts, 2U);
        EXPECT_EQ(header.componentId, 4U);
        EXPECT_EQ(header.parityCount, 1U);
        EXPECT_EQ(header.compressedSize, 9000U);
        EXPECT_TRUE(testDataBit(header.recoveryBits, 1));
        EXPECT_FALSE(testDataBit(header.recoveryBits, 2));
        EXPECT_TRUE(testParityBit(header.recoveryBits, 0));
        EXPECT_FALSE(testParityBit(header.recoveryBits, 1));
    }
    EXPECT_EQ(concatenatePayloads(parts), encoded.compressed);
}

TEST(PartitionerTest, EmptyStreamYieldsOneEmptyPart)
{
    const auto encoded = auraseal::compression::huffman::encodeBuffer({});
    const auto parts = split(encoded, 0);

    ASSERT_EQ(parts.size(), 1U);
    EXPECT_TRUE(parts[0].payload.empty());
    EXPECT_EQ(parts[0].header.totalParts, 1U);
}

TEST(PartitionerTest, RejectsPartSizesOutsideTheBound)
{
    const auto encoded = syntheticStream(100);

    EXPECT_THROW(split(encoded, 0, 0), std::invalid_argument);
    EXPECT_THROW(split(encoded, 0, kMaxPartPayload + 1), std::invalid_argument);
}

TEST(PartitionerTest, AllowsAtMost256Parts)
{
    EXPECT_EQ(split(syntheticStream(2560), 0, 10).size(), 256U);
    EXPECT_THROW(split(syntheticStream(2570), 0, 10), std::length_error);
    EXPECT_THROW(split(syntheticStream(2560), 0, 10, 1), std::length_error);
}

TEST(PartitionerTest, ConcatenationRejectsGaps)
{
    auto parts = split(syntheticStream(30), 0, 10);
    parts.erase(parts.begin() + 1);

    EXPECT_THROW(concatenatePayloads(parts), std::invalid_argument);
}

TEST(PartFormatTest, SerializesHeaderFieldsAtFixedOffsets)
{
    const auto parts = split(syntheticStream(9000), 7, kMaxPartPayload, 1);
    const auto bytes = serializePart(parts[1]);

    ASSERT_EQ(bytes.size(), kHeaderSize + 3880U + kFooterSize);
    EXPECT_EQ(bytes[0], 0xD1U);
    EXPECT_EQ(bytes[1], 0x7AU);
    EXPECT_EQ(bytes[2], 0x4CU);
    EXPECT_EQ(bytes[3], 0x00U);
    EXPECT_EQ(bytes[4], 1U);
    EXPECT_EQ(bytes[5], 2U);
    EXPECT_EQ(bytes[13], static_cast<std::uint8_t>(9000 & 0xFF));
    EXPECT_EQ(bytes[14], 0x88U);
    EXPECT_EQ(bytes[142], 0xC0U);
    EXPECT_EQ(bytes[142 + 32], 0x80U);
    EXPECT_EQ(bytes[206], kFormatVersion);
    EXPECT_EQ(bytes[207], 0U);
    EXPECT_EQ(bytes[208], 7U);
    EXPECT_EQ(bytes[209], 1U);
    EXPECT_EQ(bytes[210], static_cast<std::uint8_t>(3880 >> 8));
    EXPECT_EQ(bytes[211], static_cast<std::uint8_t>(3880 & 0xFF));
    EXPECT_EQ(bytes[219], static_cast<std::uint8_t>(9000 & 0xFF));
    EXPECT_EQ(bytes[kHeaderSize], parts[1].payload.front());
}

TEST(PartFormatTest, ParsesSerializedPart)
{
    const auto parts = split(syntheticStream(9000), 3, kMaxPartPayload, 2);
    const auto parsed = parsePart(serializePart(parts[0]));

    EXPECT_EQ(parsed.header.kind, PartKind::Data);
    EXPECT_EQ(parsed.header.componentId, 3U);
    EXPECT_EQ(parsed.header.partNumber, 0U);
    EXPECT_EQ(parsed.header.totalParts, 2U);
    EXPECT_EQ(parsed.header.parityCount, 2U);
    EXPECT_EQ(parsed.header.fullSize, 9000U);
    EXPECT_EQ(parsed.header.codeTable, parts[0].header.codeTable);
    EXPECT_EQ(parsed.payload, parts[0].payload);
    EXPECT_EQ(parsed.footer.digest, parts[0].footer.digest);
    EXPECT_EQ(parsed.footer.crc, parts[0].footer.crc);
    EXPECT_FLOAT_EQ(parsed.footer.coherence, 1.0F);
}

TEST(PartFormatTest, TwoHundredFiftySixPartsEncodeAsZero)
{
    const auto parts = split(syntheticStream(2560), 0, 10);
    const auto bytes = serializePart(parts.back());

    EXPECT_EQ(bytes[5], 0U);
    EXPECT_EQ(parsePart(bytes).header.totalParts, 256U);
}

TEST(PartFormatTest, RejectsStructuralDamage)
{
    const auto parts = split(syntheticStream(100), 0);
    const auto bytes = serializePart(parts[0]);

    auto badMagic = bytes;
    badMagic[0] ^= 0xFFU;
    EXPECT_THROW(parsePart(badMagic), auraseal::ChunkCorruptError);

    auto badReserved = bytes;
    badReserved[240] = 1;
    EXPECT_THROW(parsePart(badReserved), auraseal::ChunkCorruptError);

    auto truncated = bytes;
    truncated.pop_back();
    EXPECT_THROW(parsePart(truncated), auraseal::ChunkCorruptError);

    const std::vector<std::uint8_t> tiny(kHeaderSize, 0);
    EXPECT_THROW(decodePart(tiny), auraseal::ChunkCorruptError);
}

TEST(PartValidatorTest, AcceptsIntactPart)
{
    const auto parts = split(syntheticStream(9000), 1, kMaxPartPayload, 1);
    const auto assessment = auraseal::assembly::assessPart(serializePart(parts[0]), expectationFor(parts[0]));

    EXPECT_TRUE(assessment.accepted);
    EXPECT_TRUE(assessment.digestMatches);
    EXPECT_TRUE(assessment.crcMatches);
    EXPECT_DOUBLE_EQ(assessment.coherence, 1.0);
    EXPECT_EQ(assessment.checksPassed, assessment.checksTotal);
    ASSERT_TRUE(assessment.part.has_value());
    EXPECT_EQ(assessment.part->payload, parts[0].payload);
}

TEST(PartValidatorTest, RejectsFlippedPayloadByte)
{
    const auto parts = split(syntheticStream(9000), 1, kMaxPartPayload, 1);
    auto bytes = serializePart(parts[1]);
    bytes[kHeaderSize + 17] ^= 0x01U;

    const auto assessment = auraseal::assembly::assessPart(bytes, expectationFor(parts[1]));

    EXPECT_FALSE(assessment.accepted);
    EXPECT_FALSE(assessment.digestMatches);
}

TEST(PartValidatorTest, RejectsHeaderDamageThroughTheCrc)
{
    const auto parts = split(syntheticStream(9000), 1, kMaxPartPayload, 1);
    auto bytes = serializePart(parts[0]);
    // A code table nibble: structurally valid, caught only by the crc.
    bytes[20] ^= 0x01U;

    const auto assessment = auraseal::assembly::assessPart(bytes, expectationFor(parts[0]));

    EXPECT_TRUE(assessment.digestMatches);
    EXPECT_FALSE(assessment.crcMatches);
    EXPECT_FALSE(assessment.accepted);
}

TEST(PartValidatorTest, UnexpectedPartScoresBelowThreshold)
{
    const auto parts = split(syntheticStream(9000), 1, kMaxPartPayload, 1);
    auto expectation = expectationFor(parts[0]);
    expectation.componentId = 2;

    const auto assessment = auraseal::assembly::assessPart(serializePart(parts[0]), expectation);

    EXPECT_FALSE(assessment.accepted);
    EXPECT_EQ(assessment.checksPassed + 1U, assessment.checksTotal);
    EXPECT_LT(assessment.coherence, auraseal::assembly::kDefaultMinCoherence);
}

TEST(PartValidatorTest, SealedCoherenceScalesTheScore)
{
    auto parts = split(syntheticStream(100), 1);
    parts[0].footer.coherence = 0.5F;
    const auto bytes = serializePart(parts[0]);

    const auto strict = auraseal::assembly::assessPart(bytes, expectationFor(parts[0]));
    EXPECT_FALSE(strict.accepted);
    EXPECT_DOUBLE_EQ(strict.coherence, 0.5);

    const auto lenient = auraseal::assembly::assessPart(bytes, expectationFor(parts[0]), 0.4);
    EXPECT_TRUE(lenient.accepted);
}
