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

#ifndef INC_CONTROL_CHANNEL_H_
#define INC_CONTROL_CHANNEL_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*
 * Text control grammar carried over the transport's text messages:
 *
 *   ACK:<transfer_id_hex>:<i,j,k>   chunks the receiver holds
 *   REQ:<transfer_id_hex>:<i,j,k>   chunks the receiver wants resent
 *   OK:<transfer_id_hex>            payload reassembled and delivered
 *
 * Ids are written as 8 lowercase hex digits. Anything without one of the
 * three prefixes belongs to the application, not to this protocol.
 */

#define CONTROL_ACK 1
#define CONTROL_REQ 2
#define CONTROL_OK  3

// control_parse results
#define CONTROL_NOT_PROTOCOL  0
#define CONTROL_PARSED        1
#define CONTROL_MALFORMED    -1

struct st_control_message
{
	int type;
	uint32_t transfer_id;
	std::vector<int> chunks;   // empty for CONTROL_OK

	st_control_message() : type(0), transfer_id(0) {}
};

int control_parse(const std::string& text, st_control_message* message);

std::string control_format(const st_control_message& message);
std::string control_format_ok(uint32_t transfer_id);

// Builds one or more REQ messages covering all chunks, none longer than text_mtu characters.
std::vector<std::string> control_format_req(uint32_t transfer_id, const std::vector<int>& chunks, size_t text_mtu);

const char* control_type_string(int type);

// "0, 1, 2, 3..." style preview used in log lines.
std::string chunk_list_preview(const std::vector<int>& chunks, size_t max_shown);

#endif
