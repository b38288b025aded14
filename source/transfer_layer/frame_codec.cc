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

namespace {

void write_be32(uint8_t* out, uint32_t v)
{
	out[0]=(uint8_t)((v >> 24) & 0xFF);
	out[1]=(uint8_t)((v >> 16) & 0xFF);
	out[2]=(uint8_t)((v >> 8) & 0xFF);
	out[3]=(uint8_t)(v & 0xFF);
}

uint32_t read_be32(const uint8_t* in)
{
	return ((uint32_t)in[0] << 24) | ((uint32_t)in[1] << 16) | ((uint32_t)in[2] << 8) | (uint32_t)in[3];
}

}  // namespace

int frame_validate_header(const st_transfer_header& header)
{
	if(header.total_chunks == 0)
		return FRAME_NO_CHUNKS;
	if(header.chunk_index >= header.total_chunks)
		return FRAME_BAD_INDEX;
	if(header.total_size > MESH_MAX_PAYLOAD_SIZE)
		return FRAME_BAD_SIZE;
	return FRAME_OK;
}

int frame_encode(const st_transfer_header& header, const uint8_t* payload, size_t payload_len, std::vector<uint8_t>& frame)
{
	int status=frame_validate_header(header);
	if(status != FRAME_OK)
		return status;

	frame.resize(MESH_HEADER_SIZE + payload_len);
	uint8_t* out=frame.data();
	write_be32(out, header.transfer_id);
	out[4]=header.total_chunks;
	out[5]=header.chunk_index;
	out[6]=header.compressed ? 1 : 0;
	write_be32(out + 7, header.crc32);
	write_be32(out + 11, header.total_size);

	for(size_t i=0;i<payload_len;i++)
	{
		out[MESH_HEADER_SIZE + i]=payload[i];
	}
	return FRAME_OK;
}

int frame_decode(const uint8_t* frame, size_t frame_len, st_transfer_header* header, const uint8_t** payload, size_t* payload_len)
{
	if(frame == NULL || frame_len < MESH_HEADER_SIZE)
		return FRAME_TOO_SHORT;

	st_transfer_header h;
	h.transfer_id=read_be32(frame);
	h.total_chunks=frame[4];
	h.chunk_index=frame[5];
	h.compressed=(frame[6] != 0);
	h.crc32=read_be32(frame + 7);
	h.total_size=read_be32(frame + 11);

	int status=frame_validate_header(h);
	if(status != FRAME_OK)
		return status;

	*header=h;
	*payload=frame + MESH_HEADER_SIZE;
	*payload_len=frame_len - MESH_HEADER_SIZE;
	return FRAME_OK;
}

const char* frame_status_string(int status)
{
	switch(status)
	{
	case FRAME_OK:
		return "ok";
	case FRAME_TOO_SHORT:
		return "packet shorter than header";
	case FRAME_NO_CHUNKS:
		return "total_chunks is zero";
	case FRAME_BAD_INDEX:
		return "chunk_index out of range";
	case FRAME_BAD_SIZE:
		return "total_size above 10 MB";
	default:
		return "unknown";
	}
}
