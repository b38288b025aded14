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

#include "transfer_layer/mesh_endpoint.h"
#include <cstdio>

cl_mesh_endpoint::cl_mesh_endpoint(const std::string& _node_id, cl_transport* transport, cl_payload_sink* sink, const st_mesh_config& _config)
	: node_id(_node_id),
	  config(_config),
	  sender(transport, &mailbox, _config),
	  receiver(transport, sink, _config),
	  monitor(&receiver, _config.stall_check_ms),
	  command_handler(NULL)
{
}

cl_mesh_endpoint::~cl_mesh_endpoint()
{
	stop();
}

int cl_mesh_endpoint::start()
{
	return monitor.start();
}

void cl_mesh_endpoint::stop()
{
	monitor.stop();
}

void cl_mesh_endpoint::on_text_message(const std::string& from, const std::string& text)
{
	st_control_message message;
	int rc=control_parse(text, &message);

	if(rc == CONTROL_NOT_PROTOCOL)
	{
		if(command_handler != NULL)
			command_handler->on_command(from, text);
		else if(g_debug)
		{
			printf("[CTRL] Unhandled text from %s: %s\n", from.c_str(), text.c_str());
			fflush(stdout);
		}
		return;
	}

	if(rc == CONTROL_MALFORMED)
	{
		printf("[CTRL] Parse error in control message from %s: \"%s\"\n", from.c_str(), text.c_str());
		fflush(stdout);
		return;
	}

	if(message.type == CONTROL_ACK)
	{
		printf("[ACK] Received from %s: %zu chunks for transfer %08x\n", from.c_str(), message.chunks.size(), message.transfer_id);
	}
	else if(message.type == CONTROL_REQ)
	{
		printf("[REQ] %s requesting %zu chunks for transfer %08x\n", from.c_str(), message.chunks.size(), message.transfer_id);
	}
	else if(g_verbose)
	{
		printf("[OK] Transfer %08x reported complete by %s\n", message.transfer_id, from.c_str());
	}
	fflush(stdout);

	mailbox.post(from, message);
}

void cl_mesh_endpoint::on_data_packet(const std::string& from, const uint8_t* data, size_t len)
{
	receiver.on_chunk(from, data, len);
}

int cl_mesh_endpoint::send_payload(const std::string& destination, const std::vector<uint8_t>& payload, st_send_stats* stats)
{
	return sender.send(destination, payload, stats);
}

int cl_mesh_endpoint::send_from_source(const std::string& destination, cl_payload_source* source, st_send_stats* stats)
{
	std::vector<uint8_t> payload;
	if(source == NULL || source->read_payload(&payload) != SUCCESS)
	{
		printf("[TX] Payload source failed, nothing sent to %s\n", destination.c_str());
		fflush(stdout);
		return TRANSFER_REJECTED;
	}
	return sender.send(destination, payload, stats);
}
