/*
 * Mercury Mesh: reliable payload transfer over packet radio mesh networks.
 * Copyright (C) 2022-2024 Fadi Jerji
 * Author: Fadi Jerji
 * Email: fadi.jerji@  <gmail.com, caisresearch.com, ieee.org>
 * ORCID: 0000-0002-2076-5831
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, version 3 of the
 * License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 */


#include "compression/mercury_compress.h"
#include "common/mesh_defines.h"
#include "test_helpers.h"
#include <gtest/gtest.h>

TEST(Compressor, CompressibleDataRoundTrips)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	std::vector<uint8_t> original=text_payload(10000);
	std::vector<uint8_t> packed;
	ASSERT_EQ(COMPRESS_APPLIED, compressor.compress_payload(original, MESH_COMPRESS_MIN_SAVING, packed));
	EXPECT_LT(packed.size(), original.size() / 2);

	std::vector<uint8_t> unpacked;
	ASSERT_EQ(SUCCESS, compressor.decompress_payload(packed.data(), packed.size(), MESH_MAX_PAYLOAD_SIZE, unpacked));
	EXPECT_EQ(original, unpacked);
}

TEST(Compressor, IncompressibleDataIsSentRaw)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	// zstd cannot shrink random bytes, so the saving check keeps them raw.
	std::vector<uint8_t> original=random_payload(10000, 42);
	std::vector<uint8_t> packed;
	EXPECT_EQ(COMPRESS_SKIPPED, compressor.compress_payload(original, MESH_COMPRESS_MIN_SAVING, packed));
	EXPECT_TRUE(packed.empty());

	EXPECT_EQ(COMPRESS_SKIPPED, compressor.compress_payload(original, 0.0, packed));
}

TEST(Compressor, UniformByteRampIsCompressed)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	std::vector<uint8_t> ramp(2048);
	for(size_t i=0;i<ramp.size();i++)
		ramp[i]=(uint8_t)(i & 0xFF);
	EXPECT_FLOAT_EQ(8.0f, cl_compressor::quick_entropy(ramp.data(), ramp.size()));

	std::vector<uint8_t> packed;
	ASSERT_EQ(COMPRESS_APPLIED, compressor.compress_payload(ramp, MESH_COMPRESS_MIN_SAVING, packed));
	EXPECT_LT(packed.size(), ramp.size() / 4);

	std::vector<uint8_t> unpacked;
	ASSERT_EQ(SUCCESS, compressor.decompress_payload(packed.data(), packed.size(), MESH_MAX_PAYLOAD_SIZE, unpacked));
	EXPECT_EQ(ramp, unpacked);
}

TEST(Compressor, EntropyOfConstantDataIsZero)
{
	std::vector<uint8_t> zeros(1000, 0);
	EXPECT_FLOAT_EQ(0.0f, cl_compressor::quick_entropy(zeros.data(), zeros.size()));
}

TEST(Compressor, RejectsGarbageFrames)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	std::vector<uint8_t> garbage=pattern_payload(300);
	std::vector<uint8_t> out;
	EXPECT_EQ(ERROR_, compressor.decompress_payload(garbage.data(), garbage.size(), MESH_MAX_PAYLOAD_SIZE, out));
	EXPECT_TRUE(out.empty());
}

TEST(Compressor, RejectsFramesDeclaringTooMuchOutput)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	std::vector<uint8_t> original=text_payload(20000);
	std::vector<uint8_t> packed;
	ASSERT_EQ(COMPRESS_APPLIED, compressor.compress_payload(original, MESH_COMPRESS_MIN_SAVING, packed));

	std::vector<uint8_t> out;
	EXPECT_EQ(ERROR_, compressor.decompress_payload(packed.data(), packed.size(), 10000, out));
}

TEST(Compressor, RejectsTruncatedFrames)
{
	cl_compressor compressor;
	ASSERT_EQ(SUCCESS, compressor.init(MESH_ZSTD_LEVEL));

	std::vector<uint8_t> original=text_payload(20000);
	std::vector<uint8_t> packed;
	ASSERT_EQ(COMPRESS_APPLIED, compressor.compress_payload(original, MESH_COMPRESS_MIN_SAVING, packed));

	std::vector<uint8_t> out;
	EXPECT_EQ(ERROR_, compressor.decompress_payload(packed.data(), packed.size() / 2, MESH_MAX_PAYLOAD_SIZE, out));
}

TEST(Compressor, RequiresInit)
{
	cl_compressor compressor;
	EXPECT_FALSE(compressor.is_initialized());

	std::vector<uint8_t> packed;
	EXPECT_EQ(ERROR_, compressor.compress_payload(text_payload(1000), MESH_COMPRESS_MIN_SAVING, packed));

	ASSERT_EQ(SUCCESS, compressor.init(3));
	EXPECT_TRUE(compressor.is_initialized());
	compressor.deinit();
	EXPECT_FALSE(compressor.is_initialized());
}
