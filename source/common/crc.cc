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

namespace {

struct st_crc32_table
{
	uint32_t entry[256];

	st_crc32_table()
	{
		for(uint32_t i=0;i<256;i++)
		{
			uint32_t c=i;
			for(int k=0;k<8;k++)
			{
				if(c & 1)
					c=0xEDB88320U ^ (c >> 1);
				else
					c=c >> 1;
			}
			entry[i]=c;
		}
	}
};

const st_crc32_table& crc32_table()
{
	static const st_crc32_table table;
	return table;
}

}  // namespace

uint32_t CRC32_update(uint32_t crc, const uint8_t* data, size_t length)
{
	const st_crc32_table& table=crc32_table();
	uint32_t c=crc ^ 0xFFFFFFFFU;
	for(size_t i=0;i<length;i++)
	{
		c=table.entry[(c ^ data[i]) & 0xFF] ^ (c >> 8);
	}
	return c ^ 0xFFFFFFFFU;
}

uint32_t CRC32_calc(const uint8_t* data, size_t length)
{
	return CRC32_update(0, data, length);
}
