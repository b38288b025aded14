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

#ifndef INC_FRAME_CODEC_H_
#define INC_FRAME_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <vector>

/*
 * Chunk frame, big-endian, 15 byte header followed by the chunk payload:
 *
 *   [transfer_id:4][total_chunks:1][chunk_index:1][compressed:1][crc32:4][total_size:4][payload...]
 *
 * crc32 and total_size describe the whole transmitted stream (after
 * compression, when the compressed flag is set), not the chunk.
 */

enum frame_status
{
	FRAME_OK = 0,
	FRAME_TOO_SHORT,
	FRAME_NO_CHUNKS,
	FRAME_BAD_INDEX,
	FRAME_BAD_SIZE
};

struct st_transfer_header
{
	uint32_t transfer_id;
	uint8_t total_chunks;
	uint8_t chunk_index;
	bool compressed;
	uint32_t crc32;
	uint32_t total_size;

	st_transfer_header() : transfer_id(0), total_chunks(0), chunk_index(0), compressed(false), crc32(0), total_size(0) {}
};

int frame_validate_header(const st_transfer_header& header);

// Writes header + payload into frame. Returns FRAME_OK or the reason the header is invalid.
int frame_encode(const st_transfer_header& header, const uint8_t* payload, size_t payload_len, std::vector<uint8_t>& frame);

// Parses a received datagram. On FRAME_OK, *payload points into frame (no copy).
int frame_decode(const uint8_t* frame, size_t frame_len, st_transfer_header* header, const uint8_t** payload, size_t* payload_len);

const char* frame_status_string(int status);

#endif
