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

#ifndef INC_TRANSPORT_H_
#define INC_TRANSPORT_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Mesh device link. Both calls return SUCCESS when the device accepted the
// packet (which says nothing about delivery) and ERROR_ otherwise.
class cl_transport
{
public:
	virtual ~cl_transport() {}

	virtual int send_text(const std::string& text, const std::string& destination) = 0;
	virtual int send_data(const uint8_t* data, size_t len, const std::string& destination, bool want_ack) = 0;
};

// Receives verified, decompressed payloads. Returns SUCCESS once the
// payload has been consumed; ERROR_ makes the receiver withhold the
// completion message.
class cl_payload_sink
{
public:
	virtual ~cl_payload_sink() {}

	virtual int on_payload(const std::string& sender, uint32_t transfer_id, const std::vector<uint8_t>& payload) = 0;
};

class cl_payload_source
{
public:
	virtual ~cl_payload_source() {}

	virtual int read_payload(std::vector<uint8_t>* payload) = 0;
};

// Ordinary application text that is not protocol control traffic.
class cl_command_handler
{
public:
	virtual ~cl_command_handler() {}

	virtual void on_command(const std::string& from, const std::string& text) = 0;
};

#endif
