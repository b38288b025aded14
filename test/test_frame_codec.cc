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


#include "transfer_layer/frame_codec.h"
#include "common/mesh_defines.h"
#include <gtest/gtest.h>

namespace {

st_transfer_header sample_header()
{
	st_transfer_header header;
	header.transfer_id=0x01020304;
	header.total_chunks=11;
	header.chunk_index=5;
	header.compressed=true;
	header.crc32=0xCAFEBABE;
	header.total_size=2000;
	return header;
}

}  // namespace

TEST(FrameCodec, EncodesBigEndianHeaderThenPayload)
{
	const uint8_t payload[]={0xAA, 0xBB, 0xCC};
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), payload, sizeof(payload), frame));

	const uint8_t expected[]={
		0x01, 0x02, 0x03, 0x04,
		11,
		5,
		1,
		0xCA, 0xFE, 0xBA, 0xBE,
		0x00, 0x00, 0x07, 0xD0,
		0xAA, 0xBB, 0xCC};
	ASSERT_EQ(sizeof(expected), frame.size());
	for(size_t i=0;i<sizeof(expected);i++)
		EXPECT_EQ(expected[i], frame[i]) << "byte " << i;
}

TEST(FrameCodec, DecodeReturnsHeaderAndPayloadView)
{
	const uint8_t payload[]={1, 2, 3, 4, 5};
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), payload, sizeof(payload), frame));

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=0;
	ASSERT_EQ(FRAME_OK, frame_decode(frame.data(), frame.size(), &header, &data, &len));
	EXPECT_EQ(0x01020304u, header.transfer_id);
	EXPECT_EQ(11, header.total_chunks);
	EXPECT_EQ(5, header.chunk_index);
	EXPECT_TRUE(header.compressed);
	EXPECT_EQ(0xCAFEBABEu, header.crc32);
	EXPECT_EQ(2000u, header.total_size);
	ASSERT_EQ(sizeof(payload), len);
	EXPECT_EQ(frame.data() + MESH_HEADER_SIZE, data);
}

TEST(FrameCodec, HeaderOnlyFrameHasEmptyPayload)
{
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), NULL, 0, frame));
	ASSERT_EQ((size_t)MESH_HEADER_SIZE, frame.size());

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=99;
	EXPECT_EQ(FRAME_OK, frame_decode(frame.data(), frame.size(), &header, &data, &len));
	EXPECT_EQ(0u, len);
}

TEST(FrameCodec, RejectsShortPacket)
{
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), NULL, 0, frame));

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=0;
	EXPECT_EQ(FRAME_TOO_SHORT, frame_decode(frame.data(), MESH_HEADER_SIZE - 1, &header, &data, &len));
	EXPECT_EQ(FRAME_TOO_SHORT, frame_decode(NULL, 0, &header, &data, &len));
}

TEST(FrameCodec, RejectsZeroChunks)
{
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), NULL, 0, frame));
	frame[4]=0;
	frame[5]=0;

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=0;
	EXPECT_EQ(FRAME_NO_CHUNKS, frame_decode(frame.data(), frame.size(), &header, &data, &len));
}

TEST(FrameCodec, RejectsIndexAtOrBeyondTotal)
{
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), NULL, 0, frame));
	frame[5]=11;

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=0;
	EXPECT_EQ(FRAME_BAD_INDEX, frame_decode(frame.data(), frame.size(), &header, &data, &len));
}

TEST(FrameCodec, RejectsOversizedTotal)
{
	st_transfer_header header=sample_header();
	header.total_size=MESH_MAX_PAYLOAD_SIZE;
	EXPECT_EQ(FRAME_OK, frame_validate_header(header));
	header.total_size=MESH_MAX_PAYLOAD_SIZE + 1;
	EXPECT_EQ(FRAME_BAD_SIZE, frame_validate_header(header));

	std::vector<uint8_t> frame;
	EXPECT_EQ(FRAME_BAD_SIZE, frame_encode(header, NULL, 0, frame));
}

TEST(FrameCodec, EncodeRefusesInvalidHeader)
{
	st_transfer_header header=sample_header();
	header.chunk_index=header.total_chunks;
	std::vector<uint8_t> frame;
	EXPECT_EQ(FRAME_BAD_INDEX, frame_encode(header, NULL, 0, frame));

	header.total_chunks=0;
	header.chunk_index=0;
	EXPECT_EQ(FRAME_NO_CHUNKS, frame_encode(header, NULL, 0, frame));
}

TEST(FrameCodec, CompressedFlagIsAnyNonZeroByte)
{
	std::vector<uint8_t> frame;
	ASSERT_EQ(FRAME_OK, frame_encode(sample_header(), NULL, 0, frame));
	frame[6]=0x7F;

	st_transfer_header header;
	const uint8_t* data=NULL;
	size_t len=0;
	ASSERT_EQ(FRAME_OK, frame_decode(frame.data(), frame.size(), &header, &data, &len));
	EXPECT_TRUE(header.compressed);

	frame[6]=0;
	ASSERT_EQ(FRAME_OK, frame_decode(frame.data(), frame.size(), &header, &data, &len));
	EXPECT_FALSE(header.compressed);
}
