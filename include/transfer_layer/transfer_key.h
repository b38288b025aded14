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

#ifndef INC_TRANSFER_KEY_H_
#define INC_TRANSFER_KEY_H_

#include <cstdint>
#include <string>

// Identifies one transfer as seen by a peer: the remote node and the
// sender-chosen transfer id. Ordered by node first so all transfers of
// one node are adjacent in an ordered map.
struct st_transfer_key
{
	std::string node;
	uint32_t transfer_id;

	st_transfer_key() : transfer_id(0) {}
	st_transfer_key(const std::string& _node, uint32_t _transfer_id) : node(_node), transfer_id(_transfer_id) {}

	bool operator<(const st_transfer_key& other) const
	{
		int c = node.compare(other.node);
		if(c != 0)
			return c < 0;
		return transfer_id < other.transfer_id;
	}

	bool operator==(const st_transfer_key& other) const
	{
		return transfer_id == other.transfer_id && node == other.node;
	}
};

#endif
