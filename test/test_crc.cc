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


#include "common/crc.h"
#include <gtest/gtest.h>
#include <cstring>

TEST(Crc32, MatchesStandardCheckValue)
{
	const char* check="123456789";
	EXPECT_EQ(0xCBF43926u, CRC32_calc((const uint8_t*)check, strlen(check)));
}

TEST(Crc32, EmptyInputIsZero)
{
	EXPECT_EQ(0u, CRC32_calc(NULL, 0));
}

TEST(Crc32, UpdateAcrossBlocksEqualsSinglePass)
{
	const char* text="The quick brown fox jumps over the lazy dog";
	size_t len=strlen(text);
	uint32_t whole=CRC32_calc((const uint8_t*)text, len);
	EXPECT_EQ(0x414FA339u, whole);

	uint32_t crc=CRC32_update(0, (const uint8_t*)text, 10);
	crc=CRC32_update(crc, (const uint8_t*)text + 10, len - 10);
	EXPECT_EQ(whole, crc);
}

TEST(Crc32, DetectsSingleBitFlip)
{
	uint8_t data[64];
	for(int i=0;i<64;i++)
		data[i]=(uint8_t)i;
	uint32_t before=CRC32_calc(data, sizeof(data));
	data[17]^=0x04;
	EXPECT_NE(before, CRC32_calc(data, sizeof(data)));
}
